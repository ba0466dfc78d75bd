/**
 * @file text_encoder.hpp
 * @brief Converts UTF-8 text to the output encoding chosen for a run.
 */

#ifndef XLSXCONV_TEXT_ENCODER_HPP
#define XLSXCONV_TEXT_ENCODER_HPP

#include <string>
#include <string_view>

namespace xlsxconv {

/// Encoding used when the host supplies none.
inline constexpr std::string_view kDefaultEncoding = "utf-8";

/**
 * @brief Strict UTF-8 to target-encoding converter.
 *
 * @details Names are matched case-insensitively with '_' and '-' treated
 * alike, so "UTF_8" and "latin-1" are accepted. "utf-8" (also "utf8",
 * "u8") passes text through unchanged, "utf-8-sig" additionally prefixes a
 * byte order mark. Every other name is handed to iconv, after a few
 * aliases whose spelling iconv does not know are mapped to one it does.
 * Characters the target cannot represent are an error, never replaced.
 */
class TextEncoder {
public:
    /**
     * @throws EncodingError if iconv does not know @p encoding.
     */
    explicit TextEncoder(std::string encoding);

    /**
     * @brief Encode a complete document.
     * @throws EncodingError on a character the target encoding lacks.
     */
    [[nodiscard]] std::string encode(std::string_view utf8) const;

    [[nodiscard]] const std::string& name() const { return name_; }

private:
    enum class Kind { Utf8, Utf8Sig, Iconv };

    std::string name_;
    std::string iconv_name_;
    Kind kind_ = Kind::Utf8;
};

} // namespace xlsxconv

#endif // XLSXCONV_TEXT_ENCODER_HPP
