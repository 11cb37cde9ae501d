#pragma once
#include <string>

// Output charset of the split. Input text is UTF-8; sizes are measured after conversion.
class TextEncoding {
public:
    // Throws ConfigurationError for unknown charsets or ones that prepend a byte order mark.
    explicit TextEncoding(const std::string& name = "utf-8");

    const std::string& name() const { return name_; }
    bool isUtf8() const { return utf8_; }

    // Throws EncodingError when the text has characters the charset cannot represent.
    std::string encode(const std::string& text) const;
    size_t encodedLength(const std::string& text) const;

private:
    std::string name_;
    std::string charset_;
    bool utf8_;
};
