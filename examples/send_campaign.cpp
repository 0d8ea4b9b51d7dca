/*

send_campaign.cpp
-----------------

Runs a campaign from an accounts file and a recipients file. Ctrl-C cancels the run
and still prints the report.

    send_campaign --accounts accounts.txt --recipients recipients.txt [--config campaign.conf]
                  [--mode distribute|broadcast] [--cap N] [--delay-ms N] [--timeout S]
                  [--log-level LEVEL] [--verbose] [--trace]


Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#include <chrono>
#include <condition_variable>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <utility>

#include <boost/asio.hpp>
#include <mailcast/mailcast.hpp>

using std::cerr;
using std::cout;


namespace
{

struct cli_options
{
    std::string accounts;
    std::string recipients;
    std::string config;
    std::optional<std::string> mode;
    std::optional<std::size_t> cap;
    std::optional<long long> delay_ms;
    std::optional<long long> timeout_s;
    mailcast::log::level level = mailcast::log::level::info;
    bool trace = false;
};

void usage()
{
    cerr << "usage: send_campaign --accounts FILE --recipients FILE [--config FILE]\n"
         << "                     [--mode distribute|broadcast] [--cap N] [--delay-ms N] [--timeout S]\n"
         << "                     [--log-level trace|debug|info|warn|error|off] [--verbose] [--trace]\n";
}

void print_error(const mailcast::error_info& err)
{
    cerr << "Error: " << mailcast::to_string(err.code) << " - " << err.message << "\n";
    if (!err.detail.empty())
        cerr << "Detail: " << err.detail << "\n";
}

template<typename T>
std::optional<T> number(std::string_view text)
{
    return mailcast::detail::parse_number<T>(text);
}

std::optional<cli_options> parse_args(int argc, char* argv[])
{
    cli_options opts;
    for (int i = 1; i < argc; ++i)
    {
        const std::string_view arg = argv[i];
        auto value = [&]() -> std::optional<std::string_view>
        {
            if (i + 1 >= argc)
            {
                cerr << "missing value for " << arg << "\n";
                return std::nullopt;
            }
            return std::string_view(argv[++i]);
        };

        if (arg == "--verbose")
        {
            opts.level = mailcast::log::level::debug;
            continue;
        }
        if (arg == "--trace")
        {
            opts.level = mailcast::log::level::trace;
            opts.trace = true;
            continue;
        }
        if (arg == "--help" || arg == "-h")
            return std::nullopt;

        const auto v = value();
        if (!v)
            return std::nullopt;

        if (arg == "--accounts")
            opts.accounts = std::string(*v);
        else if (arg == "--recipients")
            opts.recipients = std::string(*v);
        else if (arg == "--config")
            opts.config = std::string(*v);
        else if (arg == "--mode")
            opts.mode = std::string(*v);
        else if (arg == "--cap")
        {
            opts.cap = number<std::size_t>(*v);
            if (!opts.cap)
            {
                cerr << "invalid --cap '" << *v << "'\n";
                return std::nullopt;
            }
        }
        else if (arg == "--delay-ms")
        {
            opts.delay_ms = number<long long>(*v);
            if (!opts.delay_ms || *opts.delay_ms < 0 || *opts.delay_ms > mailcast::campaign_config::max_delay_limit.count())
            {
                cerr << "invalid --delay-ms '" << *v << "'\n";
                return std::nullopt;
            }
        }
        else if (arg == "--timeout")
        {
            opts.timeout_s = number<long long>(*v);
            if (!opts.timeout_s || *opts.timeout_s < 0 || *opts.timeout_s > mailcast::campaign_config::max_run_timeout.count())
            {
                cerr << "invalid --timeout '" << *v << "'\n";
                return std::nullopt;
            }
        }
        else if (arg == "--log-level")
        {
            const auto lvl = mailcast::log::level_from_string(*v);
            if (!lvl)
            {
                cerr << "unknown log level '" << *v << "'\n";
                return std::nullopt;
            }
            opts.level = *lvl;
        }
        else
        {
            cerr << "unknown option " << arg << "\n";
            return std::nullopt;
        }
    }

    if (opts.accounts.empty() || opts.recipients.empty())
    {
        cerr << "--accounts and --recipients are required\n";
        return std::nullopt;
    }
    return opts;
}

// Command line flags override the configuration file.
mailcast::result_void apply_overrides(const cli_options& opts, mailcast::campaign_config& config)
{
    if (opts.mode)
    {
        const auto mode = mailcast::distribution_mode_from_string(*opts.mode);
        if (!mode)
            return mailcast::fail_void(mailcast::errc::config_invalid, "unknown mode '" + *opts.mode + "'");
        config.mode = *mode;
    }
    if (opts.cap)
        config.per_account_cap = *opts.cap;
    if (opts.delay_ms)
        config.send_delay = std::chrono::milliseconds{*opts.delay_ms};
    if (opts.timeout_s)
    {
        if (*opts.timeout_s == 0)
            config.run_timeout.reset();
        else
            config.run_timeout = std::chrono::seconds{*opts.timeout_s};
    }
    return config.validate();
}

} // namespace


int main(int argc, char* argv[])
{
    const auto opts = parse_args(argc, argv);
    if (!opts)
    {
        usage();
        return 2;
    }

    auto& logger = mailcast::log::logger::instance();
    logger.set_level(opts->level);
    logger.set_trace_enabled(opts->trace);

    auto config = opts->config.empty()
        ? mailcast::result<mailcast::campaign_config>(mailcast::campaign_config::defaults())
        : mailcast::load_campaign_config(opts->config);
    if (!config)
    {
        print_error(config.error());
        return 2;
    }
    if (auto applied = apply_overrides(*opts, *config); !applied)
    {
        print_error(applied.error());
        return 2;
    }

    auto accounts = mailcast::io::load_accounts(opts->accounts);
    if (!accounts)
    {
        print_error(accounts.error());
        return 2;
    }
    auto recipients = mailcast::io::load_recipients(opts->recipients);
    if (!recipients)
    {
        print_error(recipients.error());
        return 2;
    }

    auto credentials = std::make_shared<mailcast::static_credential_store>();
    accounts->install(*credentials);

    auto transport = std::make_shared<mailcast::smtp::smtp_transport>(config->transport);

    std::shared_ptr<mailcast::content::attachment_provider> attachments = std::make_shared<mailcast::content::no_attachments>();
    if (!config->attachments.directories.empty())
    {
        mailcast::content::directory_attachment_provider::options att;
        att.directories = config->attachments.directories;
        att.extensions = config->attachments.extensions;
        att.max_bytes = config->attachments.max_bytes;
        if (config->seed)
            att.seed = *config->seed;
        auto provider = std::make_shared<mailcast::content::directory_attachment_provider>(std::move(att));
        cout << "Attachments: " << provider->files().size() << " file(s)\n";
        attachments = std::move(provider);
    }

    mailcast::campaign_controller controller(mailcast::transport_registry::single(transport), credentials, attachments);

    // Ctrl-C and SIGTERM cancel the run
    boost::asio::io_context signal_ctx;
    boost::asio::signal_set signals(signal_ctx, SIGINT, SIGTERM);
    signals.async_wait([&controller](const boost::system::error_code& ec, int signo)
    {
        if (ec)
            return;
        cerr << "\nSignal " << signo << " received, cancelling...\n";
        controller.cancel();
    });
    std::thread signal_thread([&signal_ctx]() { signal_ctx.run(); });

    std::mutex progress_mutex;
    std::condition_variable progress_cv;
    bool finished = false;
    std::thread progress_thread([&]()
    {
        std::unique_lock<std::mutex> lock(progress_mutex);
        while (!progress_cv.wait_for(lock, std::chrono::seconds{2}, [&finished]() { return finished; }))
        {
            const auto snap = controller.snapshot();
            if (!snap.accounts.empty())
                cerr << mailcast::render_progress(snap);
        }
    });

    cout << "Sending to " << recipients->size() << " recipient(s) from " << accounts->accounts.size()
         << " account(s), mode " << mailcast::to_string(config->mode) << "\n";
    auto report = controller.run(accounts->accounts, *recipients, *config);

    {
        std::lock_guard<std::mutex> lock(progress_mutex);
        finished = true;
    }
    progress_cv.notify_all();
    progress_thread.join();
    signal_ctx.stop();
    signal_thread.join();

    if (!report)
    {
        print_error(report.error());
        return 2;
    }

    cout << mailcast::render_text(*report);
    if (report->cancelled && !report->timed_out)
        return 130;
    return report->totals.failed == 0 ? EXIT_SUCCESS : EXIT_FAILURE;
}
