/*

credential_store.hpp
--------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Source of per-account secrets. Consulted once per session open.

*/

#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>

#include <mailcast/core/account.hpp>
#include <mailcast/detail/result.hpp>
#include <mailcast/oauth2/token_source.hpp>

namespace mailcast
{

struct credential
{
    enum class kind_t
    {
        password,
        oauth2_token
    };

    std::string username;
    std::string secret;
    kind_t kind{kind_t::password};
};

class credential_store
{
public:
    virtual ~credential_store() = default;

    /**
    Secret for the account.

    @param acc Account to authenticate.
    @return    Credential, or errc::credential_unavailable.
    **/
    virtual result<credential> resolve(const account& acc) = 0;

    /**
    Obtain a fresh credential after the server rejected the current one.
    Stores without a refresh mechanism report credential_unavailable.
    **/
    virtual result<credential> refresh(const account& acc)
    {
        return fail<credential>(errc::credential_unavailable,
            "no refresh available for " + acc.id.to_string());
    }
};

/// Credentials known up front, keyed by the account's credential reference.
class static_credential_store : public credential_store
{
public:
    void add(std::string ref, credential cred)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_[std::move(ref)] = std::move(cred);
    }

    result<credential> resolve(const account& acc) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = entries_.find(acc.credential_ref);
        if (it == entries_.end())
            return fail<credential>(errc::credential_unavailable,
                "no credential for " + acc.id.to_string());
        return it->second;
    }

private:
    std::mutex mutex_;
    std::map<std::string, credential> entries_;
};

/**
OAuth2 store backed by one token source per credential reference.
Accounts without a token source fall back to the password entries.
**/
class oauth2_credential_store : public static_credential_store
{
public:
    void add_token_source(std::string ref, std::shared_ptr<oauth2::token_source> source)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        sources_[std::move(ref)] = std::move(source);
    }

    result<credential> resolve(const account& acc) override
    {
        auto source = find(acc);
        if (!source)
            return static_credential_store::resolve(acc);
        return to_credential(acc, source->get_access_token());
    }

    result<credential> refresh(const account& acc) override
    {
        auto source = find(acc);
        if (!source)
            return credential_store::refresh(acc);
        return to_credential(acc, source->refresh_access_token());
    }

private:
    std::shared_ptr<oauth2::token_source> find(const account& acc)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = sources_.find(acc.credential_ref);
        return it == sources_.end() ? nullptr : it->second;
    }

    static result<credential> to_credential(const account& acc, result<std::string> token)
    {
        if (!token)
            return fail<credential>(std::move(token).error());
        return credential{acc.address(), std::move(token).value(), credential::kind_t::oauth2_token};
    }

    std::mutex mutex_;
    std::map<std::string, std::shared_ptr<oauth2::token_source>> sources_;
};

} // namespace mailcast
