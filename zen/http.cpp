// *****************************************************************************
// * This file is part of the S3Mirror project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "http.h"

using namespace zen;


std::string zen::formatHttpError(int sc)
{
    const char* statusDescr = [&] //https://en.wikipedia.org/wiki/List_of_HTTP_status_codes
    {
        switch (sc)
        {
            //*INDENT-OFF*
            case 300: return "Multiple choices.";
            case 301: return "Moved permanently.";
            case 302: return "Moved temporarily.";
            case 303: return "See other";
            case 304: return "Not modified.";
            case 305: return "Use proxy.";
            case 306: return "Switch proxy.";
            case 307: return "Temporary redirect.";
            case 308: return "Permanent redirect.";

            case 400: return "Bad request.";
            case 401: return "Unauthorized.";
            case 402: return "Payment required.";
            case 403: return "Forbidden.";
            case 404: return "Not found.";
            case 405: return "Method not allowed.";
            case 406: return "Not acceptable.";
            case 407: return "Proxy authentication required.";
            case 408: return "Request timeout.";
            case 409: return "Conflict.";
            case 410: return "Gone.";
            case 411: return "Length required.";
            case 412: return "Precondition failed.";
            case 413: return "Payload too large.";
            case 414: return "URI too long.";
            case 415: return "Unsupported media type.";
            case 416: return "Range not satisfiable.";
            case 417: return "Expectation failed.";
                        case 421: return "Misdirected request.";
            case 422: return "Unprocessable entity.";
            case 423: return "Locked.";
            case 424: return "Failed dependency.";
            case 425: return "Too early.";
            case 426: return "Upgrade required.";
            case 428: return "Precondition required.";
            case 429: return "Too many requests.";
            case 431: return "Request header fields too large.";
            case 451: return "Unavailable for legal reasons.";

            case 500: return "Internal server error.";
            case 501: return "Not implemented.";
            case 502: return "Bad gateway.";
            case 503: return "Service unavailable.";
            case 504: return "Gateway timeout.";
            case 505: return "HTTP version not supported.";
            case 506: return "Variant also negotiates.";
            case 507: return "Insufficient storage.";
            case 508: return "Loop detected.";
            case 510: return "Not extended.";
            case 511: return "Network authentication required.";

            default:  return "";
            //*INDENT-ON*
        }
    }();

    return formatSystemError("", "HTTP status " + numberTo<std::string>(sc), statusDescr);
}


std::string zen::uriEncode(const std::string_view str, bool encodeSlash)
{
    std::string output;
    for (const char c : str)
        if (isDigit(c) || isAsciiAlpha(c) ||
            c == '-' || c == '.' || c == '_' || c == '~' || //unreserved: https://www.rfc-editor.org/rfc/rfc3986#section-2.3
            (c == '/' && !encodeSlash))
            output += c;
        else
        {
            const auto [high, low] = hexify(static_cast<unsigned char>(c)); //AWS expects upper-case hex
            output += '%';
            output += high;
            output += low;
        }
    return output;
}


std::string zen::uriDecode(const std::string_view str)
{
    std::string output;
    for (size_t i = 0; i < str.size(); ++i)
    {
        const char c = str[i];
        if (c == '%' && str.size() - i >= 3 &&
            isHexDigit(str[i + 1]) &&
            isHexDigit(str[i + 2]))
        {
            output += unhexify(str[i + 1], str[i + 2]);
            i += 2;
        }
        else
            output += c;
    }
    return output;
}
