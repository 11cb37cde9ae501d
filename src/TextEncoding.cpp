#include "TextEncoding.hpp"
#include <algorithm>
#include <cctype>
#include <unordered_map>
#include <boost/locale/encoding.hpp>
#include "SplitErrors.hpp"

namespace {

std::string normalize_name(std::string name) {
    std::transform(name.begin(), name.end(), name.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    std::replace(name.begin(), name.end(), '_', '-');
    return name;
}

// Names accepted on the command line that iconv spells differently.
const std::unordered_map<std::string, std::string>& charset_aliases() {
    static const std::unordered_map<std::string, std::string> aliases = {
        {"latin-1", "ISO-8859-1"},
        {"latin1", "ISO-8859-1"},
        {"iso-8859-1", "ISO-8859-1"},
        {"ascii", "US-ASCII"},
        {"us-ascii", "US-ASCII"},
        {"cp1252", "WINDOWS-1252"},
        {"windows-1252", "WINDOWS-1252"},
        {"utf-16le", "UTF-16LE"},
        {"utf-16be", "UTF-16BE"},
        {"utf-32le", "UTF-32LE"},
        {"utf-32be", "UTF-32BE"},
    };
    return aliases;
}

std::string convert(const std::string& text, const std::string& charset) {
    return boost::locale::conv::between(text, charset, "UTF-8", boost::locale::conv::stop);
}

}

TextEncoding::TextEncoding(const std::string& name)
    : name_(name), utf8_(false) {
    std::string key = normalize_name(name);
    if (key == "utf-8" || key == "utf8") {
        charset_ = "UTF-8";
        utf8_ = true;
        return;
    }
    auto it = charset_aliases().find(key);
    charset_ = it != charset_aliases().end() ? it->second : name;

    size_t single = 0;
    size_t twice = 0;
    try {
        single = convert("A", charset_).size();
        twice = convert("AA", charset_).size();
    } catch (const boost::locale::conv::invalid_charset_error&) {
        throw ConfigurationError("Unknown encoding: " + name);
    } catch (const boost::locale::conv::conversion_error&) {
        throw ConfigurationError("Unsupported encoding: " + name);
    }
    // Per-line sizes only add up when every conversion is stateless.
    if (single == 0 || twice != 2 * single) {
        throw ConfigurationError("Encoding " + name + " writes a byte order mark; use an explicit byte order variant");
    }
}

std::string TextEncoding::encode(const std::string& text) const {
    if (utf8_) {
        return text;
    }
    try {
        return convert(text, charset_);
    } catch (const boost::locale::conv::conversion_error&) {
        throw EncodingError("Cannot encode calendar text as " + name_);
    }
}

size_t TextEncoding::encodedLength(const std::string& text) const {
    if (utf8_) {
        return text.size();
    }
    return encode(text).size();
}
