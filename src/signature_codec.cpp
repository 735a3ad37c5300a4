#include "signature_codec.hpp"

#include <algorithm>
#include <format>
#include <string>

#include <mw/utils.hpp>

namespace {

constexpr char PARAM_CREATED[] = "created";
constexpr char PARAM_EXPIRES[] = "expires";
constexpr char PARAM_KEY_ID[] = "keyId";
constexpr char PARAM_ALG[] = "alg";
constexpr char PARAM_NONCE[] = "nonce";
constexpr char PARAM_TAG[] = "tag";
constexpr char PARAM_SEPARATOR[] = "; ";
// Enough digits for any realistic unix time without overflowing.
constexpr size_t MAX_INTEGER_DIGITS = 18;

auto malformed(std::string_view what)
{
    return std::unexpected(mw::httpError(400, std::string(what)));
}

bool isIntegerParam(std::string_view name)
{
    return name == PARAM_CREATED || name == PARAM_EXPIRES;
}

bool isKnownParam(std::string_view name)
{
    return isIntegerParam(name) || name == PARAM_KEY_ID ||
           name == PARAM_ALG || name == PARAM_NONCE || name == PARAM_TAG;
}

// Quoted strings may hold printable ASCII, except the quote and the
// backslash, which would need escaping.
bool isValidStringValue(std::string_view s)
{
    if(s.empty())
    {
        return false;
    }
    return std::all_of(s.begin(), s.end(), [](char c)
    {
        return c >= 0x20 && c <= 0x7e && c != '"' && c != '\\';
    });
}

bool isStrictBase64(std::string_view s)
{
    if(s.empty() || s.size() % 4 != 0)
    {
        return false;
    }
    size_t padding = 0;
    while(padding < 2 && padding < s.size() && s[s.size() - 1 - padding] == '=')
    {
        padding++;
    }
    std::string_view body = s.substr(0, s.size() - padding);
    return std::all_of(body.begin(), body.end(), [](char c)
    {
        return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
               (c >= '0' && c <= '9') || c == '+' || c == '/';
    });
}

mw::E<int64_t> parseInteger(std::string_view digits, std::string_view name)
{
    if(digits.empty() || digits.size() > MAX_INTEGER_DIGITS ||
       !std::all_of(digits.begin(), digits.end(),
                    [](char c) { return c >= '0' && c <= '9'; }) ||
       (digits.size() > 1 && digits[0] == '0'))
    {
        return malformed(std::format("Parameter {} must be an integer", name));
    }
    int64_t value = 0;
    for(char c : digits)
    {
        value = value * 10 + (c - '0');
    }
    return value;
}

mw::E<std::vector<std::string>> parseComponentList(std::string_view list)
{
    if(list.empty())
    {
        return malformed("Empty covered component list");
    }
    std::vector<std::string> components;
    size_t begin = 0;
    while(true)
    {
        size_t end = list.find(' ', begin);
        std::string_view token = list.substr(
            begin, end == std::string_view::npos ? end : end - begin);
        if(token.size() < 3 || token.front() != '"' || token.back() != '"')
        {
            return malformed("Covered components must be quoted");
        }
        std::string name(token.substr(1, token.size() - 2));
        if(!signature_codec::isValidComponentName(name))
        {
            return malformed(std::format("Unknown component {}", name));
        }
        if(std::find(components.begin(), components.end(), name) !=
           components.end())
        {
            return malformed(std::format("Duplicate component {}", name));
        }
        components.push_back(std::move(name));
        if(end == std::string_view::npos)
        {
            break;
        }
        begin = end + 1;
    }
    return components;
}

mw::E<void> setParam(SignatureContext& ctx, std::string_view name,
                     std::string_view value)
{
    if(name == PARAM_CREATED)
    {
        ASSIGN_OR_RETURN(ctx.created, parseInteger(value, name));
    }
    else if(name == PARAM_EXPIRES)
    {
        ASSIGN_OR_RETURN(ctx.expires, parseInteger(value, name));
    }
    else if(name == PARAM_KEY_ID)
    {
        ctx.key_id = value;
    }
    else if(name == PARAM_ALG)
    {
        ctx.alg = value;
    }
    else if(name == PARAM_NONCE)
    {
        ctx.nonce = value;
    }
    else if(name == PARAM_TAG)
    {
        ctx.tag = value;
    }
    return {};
}

// Parse “; name=value” pairs following the component list.
mw::E<void> parseParams(std::string_view rest, SignatureContext& ctx)
{
    ctx.param_order.clear();
    while(!rest.empty())
    {
        if(!rest.starts_with(PARAM_SEPARATOR))
        {
            return malformed("Signature parameters must be separated by \"; \"");
        }
        rest.remove_prefix(std::string_view(PARAM_SEPARATOR).size());

        size_t eq = rest.find('=');
        if(eq == std::string_view::npos)
        {
            return malformed("Parameter without a value");
        }
        std::string name(rest.substr(0, eq));
        rest.remove_prefix(eq + 1);
        if(!isKnownParam(name))
        {
            return malformed(std::format("Unknown parameter {}", name));
        }
        if(std::find(ctx.param_order.begin(), ctx.param_order.end(), name) !=
           ctx.param_order.end())
        {
            return malformed(std::format("Duplicate parameter {}", name));
        }

        std::string_view value;
        if(isIntegerParam(name))
        {
            size_t end = rest.find(';');
            value = rest.substr(0, end);
            rest.remove_prefix(value.size());
        }
        else
        {
            if(rest.empty() || rest.front() != '"')
            {
                return malformed(
                    std::format("Parameter {} must be quoted", name));
            }
            size_t close = rest.find('"', 1);
            if(close == std::string_view::npos)
            {
                return malformed(
                    std::format("Unterminated string in {}", name));
            }
            value = rest.substr(1, close - 1);
            rest.remove_prefix(close + 1);
            if(!isValidStringValue(value))
            {
                return malformed(
                    std::format("Invalid value for parameter {}", name));
            }
        }
        DO_OR_RETURN(setParam(ctx, name, value));
        ctx.param_order.push_back(std::move(name));
    }

    for(const std::string& required : defaultParamOrder())
    {
        if(std::find(ctx.param_order.begin(), ctx.param_order.end(),
                     required) == ctx.param_order.end())
        {
            return malformed(
                std::format("Missing parameter {}", required));
        }
    }
    if(ctx.expires < ctx.created)
    {
        return malformed("Signature expires before created");
    }
    return {};
}

} // namespace

std::vector<std::string> defaultParamOrder()
{
    return {PARAM_CREATED, PARAM_EXPIRES, PARAM_KEY_ID,
            PARAM_ALG,     PARAM_NONCE,   PARAM_TAG};
}

namespace signature_codec
{

bool isValidComponentName(std::string_view name)
{
    if(name == "@authority" || name == "@path")
    {
        return true;
    }
    // Other derived components are not supported. Header names are
    // lower case tokens.
    if(name.empty() || name.front() == '@')
    {
        return false;
    }
    return std::all_of(name.begin(), name.end(), [](char c)
    {
        return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
               c == '-' || c == '_' || c == '.';
    });
}

std::string serializeParams(const SignatureContext& ctx)
{
    std::string out = "(";
    for(size_t i = 0; i < ctx.components.size(); i++)
    {
        if(i > 0)
        {
            out += ' ';
        }
        out += std::format("\"{}\"", ctx.components[i]);
    }
    out += ')';

    for(const std::string& name : ctx.param_order)
    {
        out += PARAM_SEPARATOR;
        if(name == PARAM_CREATED)
        {
            out += std::format("{}={}", name, ctx.created);
        }
        else if(name == PARAM_EXPIRES)
        {
            out += std::format("{}={}", name, ctx.expires);
        }
        else if(name == PARAM_KEY_ID)
        {
            out += std::format("{}=\"{}\"", name, ctx.key_id);
        }
        else if(name == PARAM_ALG)
        {
            out += std::format("{}=\"{}\"", name, ctx.alg);
        }
        else if(name == PARAM_NONCE)
        {
            out += std::format("{}=\"{}\"", name, ctx.nonce);
        }
        else if(name == PARAM_TAG)
        {
            out += std::format("{}=\"{}\"", name, ctx.tag);
        }
    }
    return out;
}

std::string signatureInputHeader(const SignatureContext& ctx)
{
    return std::format("{}={}", SIGNATURE_LABEL, serializeParams(ctx));
}

std::string signatureAgentHeader(std::string_view agent_id)
{
    return std::format("\"{}\"", agent_id);
}

std::string signatureHeader(const std::vector<unsigned char>& signature)
{
    return std::format("{}=:{}:", SIGNATURE_LABEL,
                       mw::base64Encode(signature));
}

mw::E<std::string> signatureBase(const SignatureContext& ctx,
                                 const RequestContext& req)
{
    std::string base;
    for(const std::string& component : ctx.components)
    {
        std::string value;
        if(component == "@authority")
        {
            value = req.authority;
        }
        else if(component == "@path")
        {
            value = req.path;
        }
        else
        {
            auto it = req.components.find(component);
            if(it == req.components.end())
            {
                return malformed(std::format(
                    "Missing covered component {}", component));
            }
            value = it->second;
        }
        if(value.find_first_of("\r\n") != std::string::npos)
        {
            return malformed(std::format(
                "Component {} contains a line break", component));
        }
        base += std::format("\"{}\": {}\n", component, value);
    }
    base += std::format("\"@signature-params\": {}", serializeParams(ctx));
    return base;
}

mw::E<SignatureHeaders> sign(const SignatureContext& ctx,
                             const RequestContext& req,
                             const std::string& private_key,
                             const CryptoInterface& crypto)
{
    auto alg = ctx.algorithm();
    if(!alg.has_value())
    {
        return std::unexpected(mw::runtimeError(
            std::format("Unsupported algorithm {}", ctx.alg)));
    }
    for(const std::string& component : ctx.components)
    {
        if(!isValidComponentName(component))
        {
            return std::unexpected(mw::runtimeError(
                std::format("Unknown component {}", component)));
        }
    }
    ASSIGN_OR_RETURN(std::string base, signatureBase(ctx, req));
    ASSIGN_OR_RETURN(std::vector<unsigned char> sig,
                     crypto.sign(*alg, private_key, base));

    SignatureHeaders headers;
    headers.signature_agent = signatureAgentHeader(ctx.agent_id);
    headers.signature_input = signatureInputHeader(ctx);
    headers.signature = signatureHeader(sig);
    return headers;
}

mw::E<ParsedSignature> parse(const SignatureHeaders& headers)
{
    ParsedSignature result;
    SignatureContext& ctx = result.context;

    std::string_view agent = headers.signature_agent;
    if(agent.size() < 3 || agent.front() != '"' || agent.back() != '"' ||
       !isValidStringValue(agent.substr(1, agent.size() - 2)))
    {
        return malformed("Signature-Agent must be a quoted identifier");
    }
    ctx.agent_id = agent.substr(1, agent.size() - 2);

    std::string_view input = headers.signature_input;
    const std::string input_prefix = std::format("{}=(", SIGNATURE_LABEL);
    if(!input.starts_with(input_prefix))
    {
        return malformed(std::format(
            "Signature-Input must start with {}", input_prefix));
    }
    input.remove_prefix(input_prefix.size());
    size_t close = input.find(')');
    if(close == std::string_view::npos)
    {
        return malformed("Unterminated component list");
    }
    ASSIGN_OR_RETURN(ctx.components,
                     parseComponentList(input.substr(0, close)));
    DO_OR_RETURN(parseParams(input.substr(close + 1), ctx));

    std::string_view sig = headers.signature;
    const std::string sig_prefix = std::format("{}=:", SIGNATURE_LABEL);
    if(!sig.starts_with(sig_prefix) || sig.size() <= sig_prefix.size() + 1 ||
       sig.back() != ':')
    {
        return malformed(std::format(
            "Signature must look like {}<base64>:", sig_prefix));
    }
    std::string_view b64 =
        sig.substr(sig_prefix.size(), sig.size() - sig_prefix.size() - 1);
    if(!isStrictBase64(b64))
    {
        return malformed("Signature is not valid base64");
    }
    auto decoded = mw::base64Decode(std::string(b64));
    if(!decoded.has_value() || decoded->empty())
    {
        return malformed("Signature is not valid base64");
    }
    result.signature = *std::move(decoded);
    return result;
}

} // namespace signature_codec
