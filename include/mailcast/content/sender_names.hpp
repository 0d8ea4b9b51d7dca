/*

sender_names.hpp
----------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Generated sender display names.

*/

#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <string_view>

namespace mailcast::content
{

enum class sender_name_style : std::uint8_t
{
    none,       ///< no display name, bare address in From
    business,   ///< "Mary KL Global RT Consulting"
    personal    ///< "Mary K. L."
};

[[nodiscard]] constexpr std::string_view to_string(sender_name_style style) noexcept
{
    switch (style)
    {
        case sender_name_style::none: return "none";
        case sender_name_style::business: return "business";
        case sender_name_style::personal: return "personal";
    }
    return "none";
}

[[nodiscard]] inline std::optional<sender_name_style> sender_name_style_from_string(std::string_view name) noexcept
{
    if (name == "none")
        return sender_name_style::none;
    if (name == "business")
        return sender_name_style::business;
    if (name == "personal")
        return sender_name_style::personal;
    return std::nullopt;
}

namespace names
{

inline constexpr std::array<std::string_view, 40> first{
    "James", "Mary", "Robert", "Patricia", "John", "Jennifer", "Michael", "Linda",
    "William", "Elizabeth", "David", "Barbara", "Richard", "Susan", "Joseph", "Jessica",
    "Thomas", "Sarah", "Charles", "Karen", "Daniel", "Nancy", "Matthew", "Lisa",
    "Anthony", "Helen", "Mark", "Sandra", "Steven", "Carol", "Andrew", "Ruth",
    "Kevin", "Laura", "Brian", "Amy", "George", "Emma", "Peter", "Rachel"};

inline constexpr std::array<std::string_view, 16> letters{
    "CS", "BT", "AU", "WO", "TF", "KL", "MN", "RT", "PQ", "XY", "ZW", "VU", "ST", "GH", "JK", "DF"};

inline constexpr std::array<std::string_view, 24> words{
    "Wood", "Steel", "Tech", "Digital", "Global", "Prime", "Elite", "Advanced",
    "Smart", "Future", "Modern", "Royal", "Premier", "Capital", "United", "Central",
    "National", "Strategic", "Creative", "Dynamic", "Quality", "Vision", "Secure", "Trusted"};

inline constexpr std::array<std::string_view, 16> suffixes{
    "Foundation", "Consulting", "Co", "Services", "Ltd", "Institute", "Corp.", "Trust",
    "Technologies", "Company", "Industries", "LLP", "Solutions", "Group", "Inc", "LLC"};

} // namespace names

/**
Display name generator. One instance per worker, so no locking.
**/
class sender_name_generator
{
public:
    sender_name_generator(sender_name_style style, std::uint64_t seed)
        : style_(style), rng_(seed)
    {
    }

    [[nodiscard]] sender_name_style style() const noexcept
    {
        return style_;
    }

    /// Next display name, empty for sender_name_style::none.
    std::string next()
    {
        switch (style_)
        {
            case sender_name_style::business:
                return business();
            case sender_name_style::personal:
                return personal();
            case sender_name_style::none:
                break;
        }
        return {};
    }

private:
    template<std::size_t N>
    std::string_view pick(const std::array<std::string_view, N>& pool)
    {
        std::uniform_int_distribution<std::size_t> dist(0, N - 1);
        return pool[dist(rng_)];
    }

    char letter()
    {
        std::uniform_int_distribution<int> dist(0, 25);
        return static_cast<char>('A' + dist(rng_));
    }

    std::string business()
    {
        std::string out(pick(names::first));
        out += ' ';
        out += pick(names::letters);
        out += ' ';
        out += pick(names::words);
        out += ' ';
        out += pick(names::letters);
        out += ' ';
        out += pick(names::suffixes);
        return out;
    }

    std::string personal()
    {
        std::string out(pick(names::first));
        out += ' ';
        out += letter();
        out += ". ";
        out += letter();
        out += '.';
        return out;
    }

    sender_name_style style_;
    std::mt19937_64 rng_;
};

} // namespace mailcast::content
