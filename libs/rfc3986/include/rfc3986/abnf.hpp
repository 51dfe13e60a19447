#pragma once

/**
 * Core character classes.
 *
 * https://tools.ietf.org/html/rfc3986#appendix-A
 * https://tools.ietf.org/html/rfc2234#section-6.1
 *
 * Locale independent, unlike <cctype>.
 */

namespace rfc3986
{

/** ALPHA = %x41-5A / %x61-7A */
constexpr bool isAlpha(char c) noexcept
{
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
}

/** DIGIT = %x30-39 */
constexpr bool isDigit(char c) noexcept
{
    return c >= '0' && c <= '9';
}

/** unreserved = ALPHA / DIGIT / "-" / "." / "_" / "~" */
constexpr bool isUnreserved(char c) noexcept
{
    return isAlpha(c) || isDigit(c) ||
        c == '-' || c == '.' || c == '_' || c == '~';
}

}
