/*

smtp_transport.hpp
------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

SMTP submission sessions over Boost.Asio with OpenSSL.
All I/O completes into error codes; nothing on this path throws.

*/

#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include <mailcast/codec/base64.hpp>
#include <mailcast/core/account.hpp>
#include <mailcast/core/message.hpp>
#include <mailcast/credentials/credential_store.hpp>
#include <mailcast/detail/asio_decl.hpp>
#include <mailcast/detail/log.hpp>
#include <mailcast/detail/redact.hpp>
#include <mailcast/detail/result.hpp>
#include <mailcast/oauth2/token.hpp>
#include <mailcast/transport/error_mapping.hpp>
#include <mailcast/transport/mime.hpp>
#include <mailcast/transport/provider_directory.hpp>
#include <mailcast/transport/smtp_options.hpp>
#include <mailcast/transport/smtp_types.hpp>
#include <mailcast/transport/transport.hpp>

namespace mailcast::smtp
{

/**
Timer that cancels a socket when an operation overruns.
Lives on the session's executor, so its handler never races the coroutine.
**/
class deadline_guard
{
public:
    deadline_guard(const asio::any_io_executor& executor, asio::tcp::socket& socket, std::chrono::milliseconds limit)
        : timer_(executor), state_(std::make_shared<state>())
    {
        timer_.expires_after(limit);
        timer_.async_wait([st = state_, &socket](const asio::error_code& ec)
        {
            if (ec || !st->active)
                return;
            st->fired = true;
            asio::error_code ignored;
            socket.cancel(ignored);
        });
    }

    deadline_guard(const deadline_guard&) = delete;
    deadline_guard& operator=(const deadline_guard&) = delete;

    ~deadline_guard()
    {
        state_->active = false;
        timer_.cancel();
    }

    [[nodiscard]] bool fired() const noexcept
    {
        return state_->fired;
    }

private:
    struct state
    {
        bool active = true;
        bool fired = false;
    };

    asio::steady_timer timer_;
    std::shared_ptr<state> state_;
};

class smtp_session : public transport_session
{
public:
    smtp_session(asio::any_io_executor executor, asio::ssl::context& tls_context, endpoint ep, smtp_options options)
        : executor_(std::move(executor)),
          stream_(executor_, tls_context),
          endpoint_(std::move(ep)),
          options_(std::move(options))
    {
    }

    smtp_session(const smtp_session&) = delete;
    smtp_session& operator=(const smtp_session&) = delete;

    /**
    Connect, read the greeting, negotiate TLS and authenticate.

    @param cred Password or OAuth2 token; an empty password skips AUTH.
    @return     Success, or the first failure on the way.
    **/
    asio::awaitable<result_void> connect_and_login(const credential& cred)
    {
        auto connected = co_await connect();
        if (!connected)
            co_return connected;

        auto greeting = co_await read_reply(options_.command_timeout);
        if (!greeting)
            co_return fail_void(std::move(greeting).error());
        if (greeting->status != 220)
            co_return fail_void(make_smtp_error(endpoint_.host, command_kind::greeting, {}, *greeting));

        auto hello = co_await ehlo();
        if (!hello)
            co_return hello;

        if (endpoint_.tls == tls_mode::starttls)
        {
            auto upgraded = co_await start_tls();
            if (!upgraded)
                co_return upgraded;
            hello = co_await ehlo();
            if (!hello)
                co_return hello;
        }

        auto authenticated = co_await authenticate(cred);
        if (!authenticated)
            co_return authenticated;

        open_ = true;
        MAILCAST_LOG_DEBUG("SMTP", "session ready " << endpoint_.host << ":" << endpoint_.port
            << " as " << cred.username);
        co_return ok();
    }

    asio::awaitable<bool> probe() override
    {
        if (!open_)
            co_return false;
        auto rep = co_await command(command_kind::noop, "NOOP", options_.command_timeout);
        if (!rep || !rep->is_positive_completion())
        {
            open_ = false;
            co_return false;
        }
        co_return true;
    }

    asio::awaitable<result_void> send(const message& msg) override
    {
        if (!open_)
            co_return fail_void(errc::smtp_invalid_state, "send on a closed SMTP session");
        if (!valid_envelope_address(msg.from) || !valid_envelope_address(msg.to))
            co_return fail_void(errc::smtp_rejected_recipient, "address contains forbidden characters");

        auto step = co_await expect_positive(command_kind::mail_from, "MAIL FROM:<" + msg.from + ">");
        if (!step)
            co_return co_await abort_transaction(std::move(step).error());

        step = co_await expect_positive(command_kind::rcpt_to, "RCPT TO:<" + msg.to + ">");
        if (!step)
            co_return co_await abort_transaction(std::move(step).error());

        auto data = co_await command(command_kind::data_cmd, "DATA", options_.command_timeout);
        if (!data)
            co_return co_await abort_transaction(std::move(data).error());
        if (data->status != 354)
            co_return co_await abort_transaction(make_smtp_error(endpoint_.host, command_kind::data_cmd, "DATA", *data));

        const std::string payload = mime::dot_stuff(mime::render(msg));
        MAILCAST_TRACE_SEND("SMTP", "<message body, " + std::to_string(payload.size()) + " bytes>");
        auto written = co_await write_raw(payload, options_.data_timeout);
        if (!written)
            co_return co_await abort_transaction(std::move(written).error());

        auto accepted = co_await read_reply(options_.data_timeout);
        if (!accepted)
            co_return co_await abort_transaction(std::move(accepted).error());
        if (!accepted->is_positive_completion())
            co_return co_await abort_transaction(make_smtp_error(endpoint_.host, command_kind::data_body, {}, *accepted));

        co_return ok();
    }

    asio::awaitable<void> close() override
    {
        if (open_)
        {
            open_ = false;
            auto bye = co_await command(command_kind::quit, "QUIT", std::chrono::milliseconds{5000});
            if (!bye)
                MAILCAST_LOG_DEBUG("SMTP", "QUIT failed on " << endpoint_.host << ": " << bye.error().to_string());
        }
        shutdown_socket();
        co_return;
    }

    [[nodiscard]] bool is_open() const noexcept override
    {
        return open_;
    }

    [[nodiscard]] const capabilities& server_capabilities() const noexcept
    {
        return capabilities_;
    }

    [[nodiscard]] bool tls_active() const noexcept
    {
        return tls_active_;
    }

private:
    using stream_type = asio::ssl::stream<asio::tcp::socket>;

    asio::tcp::socket& socket() noexcept
    {
        return stream_.next_layer();
    }

    static bool valid_envelope_address(std::string_view address) noexcept
    {
        if (address.empty())
            return false;
        for (char ch : address)
        {
            if (ch == '\r' || ch == '\n' || ch == '\0' || ch == '<' || ch == '>')
                return false;
        }
        return true;
    }

    void shutdown_socket() noexcept
    {
        asio::error_code ignored;
        if (socket().is_open())
        {
            socket().shutdown(asio::tcp::socket::shutdown_both, ignored);
            socket().close(ignored);
        }
        open_ = false;
    }

    asio::awaitable<result_void> connect()
    {
        asio::error_code ec;
        asio::tcp::resolver resolver(executor_);
        auto endpoints = co_await resolver.async_resolve(endpoint_.host, std::to_string(endpoint_.port),
            asio::use_nothrow_awaitable(ec));
        if (ec)
            co_return fail_void(net::make_net_error(net::io_stage::resolve, ec, false, endpoint_.host, endpoint_.port));

        bool timed_out = false;
        {
            deadline_guard deadline(executor_, socket(), options_.connect_timeout);
            co_await asio::async_connect(socket(), endpoints, asio::use_nothrow_awaitable(ec));
            timed_out = deadline.fired();
        }
        if (ec || timed_out)
            co_return fail_void(net::make_net_error(net::io_stage::connect, ec, timed_out, endpoint_.host, endpoint_.port));

        if (endpoint_.tls == tls_mode::implicit)
            co_return co_await handshake();
        co_return ok();
    }

    asio::awaitable<result_void> handshake()
    {
        asio::error_code ec;
        if (options_.verify_peer)
        {
            stream_.set_verify_mode(asio::ssl::verify_peer, ec);
            if (!ec)
                stream_.set_verify_callback(asio::ssl::host_name_verification(endpoint_.host), ec);
        }
        else
        {
            stream_.set_verify_mode(asio::ssl::verify_none, ec);
        }
        if (ec)
            co_return fail_void(net::make_net_error(net::io_stage::handshake, ec, false, endpoint_.host, endpoint_.port));
        // SNI
        SSL_set_tlsext_host_name(stream_.native_handle(), endpoint_.host.c_str());

        bool timed_out = false;
        {
            deadline_guard deadline(executor_, socket(), options_.connect_timeout);
            co_await stream_.async_handshake(asio::ssl::stream_base::client, asio::use_nothrow_awaitable(ec));
            timed_out = deadline.fired();
        }
        if (ec || timed_out)
            co_return fail_void(net::make_net_error(net::io_stage::handshake, ec, timed_out, endpoint_.host, endpoint_.port));

        tls_active_ = true;
        co_return ok();
    }

    asio::awaitable<result_void> ehlo()
    {
        const std::string name = options_.helo_domain.empty() ? std::string("localhost") : options_.helo_domain;
        auto rep = co_await command(command_kind::ehlo, "EHLO " + name, options_.command_timeout);
        if (!rep)
            co_return fail_void(std::move(rep).error());
        if (rep->is_positive_completion())
        {
            capabilities_ = capabilities::parse(*rep);
            co_return ok();
        }
        if (!rep->is_permanent_negative())
            co_return fail_void(make_smtp_error(endpoint_.host, command_kind::ehlo, "EHLO " + name, *rep));

        auto helo = co_await expect_positive(command_kind::helo, "HELO " + name);
        if (!helo)
            co_return helo;
        capabilities_ = capabilities{};
        co_return ok();
    }

    asio::awaitable<result_void> start_tls()
    {
        if (!capabilities_.supports("STARTTLS"))
        {
            error_info err = make_error(errc::tls_handshake_failed, "server did not advertise STARTTLS");
            err.where = "smtp.starttls";
            co_return fail_void(std::move(err));
        }
        auto rep = co_await command(command_kind::starttls, "STARTTLS", options_.command_timeout);
        if (!rep)
            co_return fail_void(std::move(rep).error());
        if (rep->status != 220)
            co_return fail_void(make_smtp_error(endpoint_.host, command_kind::starttls, "STARTTLS", *rep));
        // anything buffered before the handshake belongs to the plain-text phase
        read_buffer_.clear();
        co_return co_await handshake();
    }

    asio::awaitable<result_void> authenticate(const credential& cred)
    {
        if (cred.kind == credential::kind_t::oauth2_token)
        {
            const std::string line = "AUTH XOAUTH2 " + oauth2::xoauth2_initial_response(cred.username, cred.secret);
            auto rep = co_await command(command_kind::auth, line, options_.command_timeout);
            if (!rep)
                co_return fail_void(std::move(rep).error());
            if (rep->status == 334)
            {
                // the challenge carries the error; an empty line fetches the final reply
                rep = co_await command(command_kind::auth, "", options_.command_timeout);
                if (!rep)
                    co_return fail_void(std::move(rep).error());
            }
            if (!rep->is_positive_completion())
                co_return fail_void(make_smtp_error(endpoint_.host, command_kind::auth, line, *rep));
            co_return ok();
        }

        if (cred.secret.empty())
            co_return ok();

        if (!capabilities_.supports_auth("PLAIN") && capabilities_.supports_auth("LOGIN"))
        {
            auto rep = co_await command(command_kind::auth, "AUTH LOGIN", options_.command_timeout);
            if (!rep)
                co_return fail_void(std::move(rep).error());
            if (rep->status != 334)
                co_return fail_void(make_smtp_error(endpoint_.host, command_kind::auth, "AUTH LOGIN", *rep));
            rep = co_await command(command_kind::auth, codec::base64_encode(cred.username), options_.command_timeout);
            if (!rep)
                co_return fail_void(std::move(rep).error());
            if (rep->status != 334)
                co_return fail_void(make_smtp_error(endpoint_.host, command_kind::auth, "AUTH LOGIN", *rep));
            rep = co_await command(command_kind::auth, codec::base64_encode(cred.secret), options_.command_timeout);
            if (!rep)
                co_return fail_void(std::move(rep).error());
            if (!rep->is_positive_completion())
                co_return fail_void(make_smtp_error(endpoint_.host, command_kind::auth, "AUTH LOGIN", *rep));
            co_return ok();
        }

        std::string plain;
        plain.reserve(cred.username.size() + cred.secret.size() + 2);
        plain.push_back('\0');
        plain += cred.username;
        plain.push_back('\0');
        plain += cred.secret;
        const std::string line = "AUTH PLAIN " + codec::base64_encode(plain);
        auto rep = co_await command(command_kind::auth, line, options_.command_timeout);
        if (!rep)
            co_return fail_void(std::move(rep).error());
        if (!rep->is_positive_completion())
            co_return fail_void(make_smtp_error(endpoint_.host, command_kind::auth, line, *rep));
        co_return ok();
    }

    /// Command whose reply must be 2xx.
    asio::awaitable<result_void> expect_positive(command_kind kind, const std::string& line)
    {
        auto rep = co_await command(kind, line, options_.command_timeout);
        if (!rep)
            co_return fail_void(std::move(rep).error());
        if (!rep->is_positive_completion())
            co_return fail_void(make_smtp_error(endpoint_.host, kind, line, *rep));
        co_return ok();
    }

    /// Reset the transaction after a rejection so the session stays usable.
    asio::awaitable<result_void> abort_transaction(error_info err)
    {
        const bool connection_lost = !err.reply_code || err.code == errc::smtp_service_not_available;
        if (connection_lost)
        {
            shutdown_socket();
            co_return fail_void(std::move(err));
        }
        auto rep = co_await command(command_kind::rset, "RSET", options_.command_timeout);
        if (!rep || !rep->is_positive_completion())
        {
            MAILCAST_LOG_DEBUG("SMTP", "RSET failed on " << endpoint_.host << ", dropping session");
            shutdown_socket();
        }
        co_return fail_void(std::move(err));
    }

    asio::awaitable<result<reply>> command(command_kind kind, const std::string& line, std::chrono::milliseconds timeout)
    {
        MAILCAST_TRACE_SEND("SMTP", detail::redact_line(line));
        auto written = co_await write_raw(line + "\r\n", timeout);
        if (!written)
        {
            error_info err = std::move(written).error();
            err.where = "smtp.";
            err.where += command_name(kind);
            co_return fail<reply>(std::move(err));
        }
        co_return co_await read_reply(timeout);
    }

    asio::awaitable<result_void> write_raw(const std::string& data, std::chrono::milliseconds timeout)
    {
        asio::error_code ec;
        bool timed_out = false;
        {
            deadline_guard deadline(executor_, socket(), timeout);
            if (tls_active_)
                co_await asio::async_write(stream_, asio::buffer(data), asio::use_nothrow_awaitable(ec));
            else
                co_await asio::async_write(socket(), asio::buffer(data), asio::use_nothrow_awaitable(ec));
            timed_out = deadline.fired();
        }
        if (ec || timed_out)
        {
            shutdown_socket();
            co_return fail_void(net::make_net_error(net::io_stage::write, ec, timed_out, endpoint_.host, endpoint_.port));
        }
        co_return ok();
    }

    asio::awaitable<result<std::string>> read_line(std::chrono::milliseconds timeout)
    {
        auto pos = read_buffer_.find('\n');
        if (pos == std::string::npos)
        {
            asio::error_code ec;
            bool timed_out = false;
            {
                deadline_guard deadline(executor_, socket(), timeout);
                auto buffer = asio::dynamic_buffer(read_buffer_, options_.max_line_length + 2);
                if (tls_active_)
                    co_await asio::async_read_until(stream_, buffer, '\n', asio::use_nothrow_awaitable(ec));
                else
                    co_await asio::async_read_until(socket(), buffer, '\n', asio::use_nothrow_awaitable(ec));
                timed_out = deadline.fired();
            }
            if (ec || timed_out)
            {
                shutdown_socket();
                co_return fail<std::string>(net::make_net_error(net::io_stage::read, ec, timed_out, endpoint_.host, endpoint_.port));
            }
            pos = read_buffer_.find('\n');
            if (pos == std::string::npos)
            {
                shutdown_socket();
                co_return fail<std::string>(errc::smtp_bad_reply, "reply line without terminator");
            }
        }

        const std::size_t length = (pos > 0 && read_buffer_[pos - 1] == '\r') ? pos - 1 : pos;
        std::string line = read_buffer_.substr(0, length);
        read_buffer_.erase(0, pos + 1);
        MAILCAST_TRACE_RECV("SMTP", line);
        co_return line;
    }

    asio::awaitable<result<reply>> read_reply(std::chrono::milliseconds timeout)
    {
        reply rep;
        for (;;)
        {
            auto line = co_await read_line(timeout);
            if (!line)
                co_return fail<reply>(std::move(line).error());
            const auto parsed = parse_reply_line(*line);
            if (!parsed || (rep.status != 0 && parsed->status != rep.status))
            {
                shutdown_socket();
                error_info err = make_error(errc::smtp_bad_reply, "malformed reply: " + *line);
                err.where = "smtp.reply";
                co_return fail<reply>(std::move(err));
            }
            rep.status = parsed->status;
            rep.lines.push_back(parsed->text);
            if (!parsed->more)
                break;
        }
        co_return rep;
    }

    asio::any_io_executor executor_;
    stream_type stream_;
    endpoint endpoint_;
    smtp_options options_;
    capabilities capabilities_;
    std::string read_buffer_;
    bool tls_active_ = false;
    bool open_ = false;
};

/// Opens SMTP sessions; the endpoint comes from the provider directory.
class smtp_transport : public transport
{
public:
    explicit smtp_transport(smtp_options options = {}, provider_directory providers = provider_directory::with_defaults())
        : options_(std::move(options)),
          providers_(std::move(providers)),
          tls_context_(asio::ssl::context::tls_client)
    {
        asio::error_code ec;
        tls_context_.set_default_verify_paths(ec);
        if (ec)
            MAILCAST_LOG_WARN("SMTP", "cannot load system CA certificates: " << ec.message());
    }

    asio::awaitable<result<std::unique_ptr<transport_session>>> open(const account& acc, const credential& cred) override
    {
        auto ep = providers_.resolve(acc);
        if (!ep)
            co_return fail<std::unique_ptr<transport_session>>(std::move(ep).error());

        auto executor = co_await asio::this_coro::executor;
        auto session = std::make_unique<smtp_session>(executor, tls_context_, *ep, options_);
        auto opened = co_await session->connect_and_login(cred);
        if (!opened)
        {
            co_await session->close();
            co_return fail<std::unique_ptr<transport_session>>(std::move(opened).error());
        }
        co_return std::unique_ptr<transport_session>(std::move(session));
    }

    [[nodiscard]] const provider_directory& providers() const noexcept
    {
        return providers_;
    }

private:
    smtp_options options_;
    provider_directory providers_;
    asio::ssl::context tls_context_;
};

} // namespace mailcast::smtp
