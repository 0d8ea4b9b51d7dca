/*

transport.hpp
-------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Protocol-neutral session interfaces used by the connection manager.

*/

#pragma once

#include <map>
#include <memory>
#include <utility>

#include <mailcast/core/account.hpp>
#include <mailcast/core/message.hpp>
#include <mailcast/credentials/credential_store.hpp>
#include <mailcast/detail/asio_decl.hpp>
#include <mailcast/detail/result.hpp>

namespace mailcast
{

/**
One open, authenticated connection for one account.
Destroying a session releases its socket without a protocol goodbye; call
close() first for an orderly shutdown.
**/
class transport_session
{
public:
    virtual ~transport_session() = default;

    /// Cheap liveness check (SMTP NOOP). False means the session must be replaced.
    virtual asio::awaitable<bool> probe() = 0;

    /// One message, one recipient.
    virtual asio::awaitable<result_void> send(const message& msg) = 0;

    /// Orderly shutdown. Never fails; safe to call more than once.
    virtual asio::awaitable<void> close() = 0;

    [[nodiscard]] virtual bool is_open() const noexcept = 0;
};

/// Factory for sessions of one protocol.
class transport
{
public:
    virtual ~transport() = default;

    virtual asio::awaitable<result<std::unique_ptr<transport_session>>> open(const account& acc, const credential& cred) = 0;
};

/// Transports keyed by protocol kind.
class transport_registry
{
public:
    void add(protocol_kind kind, std::shared_ptr<transport> t)
    {
        transports_[kind] = std::move(t);
    }

    [[nodiscard]] std::shared_ptr<transport> find(protocol_kind kind) const
    {
        const auto it = transports_.find(kind);
        return it == transports_.end() ? nullptr : it->second;
    }

    /// Same transport for every protocol kind.
    static transport_registry single(std::shared_ptr<transport> t)
    {
        transport_registry reg;
        reg.add(protocol_kind::smtp, t);
        reg.add(protocol_kind::smtp_oauth2, std::move(t));
        return reg;
    }

private:
    std::map<protocol_kind, std::shared_ptr<transport>> transports_;
};

} // namespace mailcast
