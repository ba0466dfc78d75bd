#include "../../include/text_encoder.hpp"
#include "../../include/errors.hpp"

#include <iconv.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <utility>
#include <vector>

namespace xlsxconv {

namespace {

// lowercase, '_' and ' ' folded into '-'
std::string normalize(std::string s) {
    std::ranges::transform(s, s.begin(), [](const unsigned char c) {
        if (c == '_' || c == ' ') return '-';
        return static_cast<char>(std::tolower(c));
    });
    return s;
}

// names users commonly type that glibc iconv spells differently
constexpr std::array<std::pair<std::string_view, std::string_view>, 8> kIconvAliases{{
    {"latin-1", "LATIN1"},
    {"latin", "LATIN1"},
    {"l1", "LATIN1"},
    {"iso-8859-1", "ISO-8859-1"},
    {"iso8859-1", "ISO-8859-1"},
    {"shift-jis", "SHIFT_JIS"},
    {"ks-c-5601-1987", "CP949"},
    {"euckr", "EUC-KR"},
}};

std::string_view iconv_alias(const std::string_view key) {
    for (const auto& [from, to] : kIconvAliases) {
        if (from == key) return to;
    }
    return {};
}

// owns one iconv descriptor
class IconvHandle {
public:
    explicit IconvHandle(const std::string& to)
        : cd_(iconv_open(to.c_str(), "UTF-8")) {}

    ~IconvHandle() {
        if (valid()) iconv_close(cd_);
    }

    IconvHandle(const IconvHandle&) = delete;
    IconvHandle& operator=(const IconvHandle&) = delete;

    [[nodiscard]] bool valid() const { return cd_ != reinterpret_cast<iconv_t>(-1); }
    [[nodiscard]] iconv_t get() const { return cd_; }

private:
    iconv_t cd_;
};

} // namespace

TextEncoder::TextEncoder(std::string encoding)
    : name_(std::move(encoding)) {
    const auto key = normalize(name_);
    if (key == "utf-8" || key == "utf8" || key == "u8" || key == "utf") {
        kind_ = Kind::Utf8;
        return;
    }
    if (key == "utf-8-sig" || key == "utf8-sig") {
        kind_ = Kind::Utf8Sig;
        return;
    }

    kind_ = Kind::Iconv;
    std::vector<std::string> candidates;
    if (const auto alias = iconv_alias(key); !alias.empty()) {
        candidates.emplace_back(alias);
    }
    candidates.push_back(name_);
    candidates.push_back(key);

    for (const auto& candidate : candidates) {
        if (IconvHandle(candidate).valid()) {
            iconv_name_ = candidate;
            return;
        }
    }
    throw EncodingError("unknown encoding: " + name_);
}

std::string TextEncoder::encode(const std::string_view utf8) const {
    switch (kind_) {
        case Kind::Utf8:
            return std::string(utf8);
        case Kind::Utf8Sig:
            return std::string("\xEF\xBB\xBF") + std::string(utf8);
        case Kind::Iconv:
            break;
    }

    const IconvHandle cd(iconv_name_);
    if (!cd.valid()) {
        throw EncodingError("unknown encoding: " + name_);
    }

    std::vector<char> in(utf8.begin(), utf8.end());
    char* in_ptr = in.data();
    std::size_t in_left = in.size();

    std::string out;
    std::vector<char> buf(16 * 1024);

    // the trailing call with a null input flushes shift state for stateful encodings
    bool flushing = false;
    for (;;) {
        char* out_ptr = buf.data();
        std::size_t out_left = buf.size();
        const std::size_t rc = flushing
                                   ? iconv(cd.get(), nullptr, nullptr, &out_ptr, &out_left)
                                   : iconv(cd.get(), &in_ptr, &in_left, &out_ptr, &out_left);
        out.append(buf.data(), buf.size() - out_left);

        if (rc != static_cast<std::size_t>(-1)) {
            if (flushing) break;
            if (in_left == 0) flushing = true;
            continue;
        }
        if (errno == E2BIG) {
            continue;
        }
        const auto offset = static_cast<std::size_t>(in_ptr - in.data());
        if (errno == EILSEQ) {
            throw EncodingError("character at byte " + std::to_string(offset) +
                                " cannot be encoded as " + name_);
        }
        if (errno == EINVAL) {
            throw EncodingError("incomplete UTF-8 sequence at byte " + std::to_string(offset));
        }
        throw EncodingError("iconv failed for " + name_ + ": " + std::strerror(errno));
    }
    return out;
}

} // namespace xlsxconv
