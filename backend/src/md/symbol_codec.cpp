#include "symbol_codec.hpp"

#include <array>
#include <cctype>

static std::string lower(std::string s)
{
    for (auto &ch : s) ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    return s;
}

static std::string upper(std::string s)
{
    for (auto &ch : s) ch = static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));
    return s;
}

static std::string strip_dash(const std::string &s)
{
    std::string out;
    out.reserve(s.size());
    for (char ch : s)
        if (ch != '-')
            out.push_back(ch);
    return out;
}

std::string SymbolCodec::to_venue(const std::string &venue, const std::string &c)
{
    const std::string venue_lc = lower(venue);

    if (venue_lc == "binance")
    {
        return lower(strip_dash(c));
    }
    else if (venue_lc == "bybit")
    {
        return upper(strip_dash(c));
    }
    else if (venue_lc == "okx")
    {
        return upper(c);
    }
    return c;
}

std::string SymbolCodec::to_canonical(const std::string &venue, const std::string &v)
{
    const std::string venue_lc = lower(venue);

    if (venue_lc == "binance" || venue_lc == "bybit")
    {
        static const std::array<const char *, 6> quotes = {"USDT", "USDC", "FDUSD", "BTC", "ETH", "EUR"};
        const std::string u = upper(v);
        for (const char *q : quotes)
        {
            const std::string quote(q);
            if (u.size() > quote.size() &&
                u.compare(u.size() - quote.size(), quote.size(), quote) == 0)
            {
                return u.substr(0, u.size() - quote.size()) + "-" + quote;
            }
        }
        return u;
    }
    return upper(v);
}
