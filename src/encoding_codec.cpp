#include "encoding_codec.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <map>

namespace encache {

namespace {

const char kBase64Alphabet[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
const char kBase32Alphabet[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZ234567";
const char kHexLower[] = "0123456789abcdef";
const char kHexUpper[] = "0123456789ABCDEF";

constexpr uint8_t kYencShift = 42;
constexpr uint8_t kYencEscape = 0x3D;
constexpr uint8_t kYencEscapeShift = 64;
constexpr uint8_t kBase85First = '!';
constexpr int8_t kInvalid = -1;

using ReverseTable = std::array<int8_t, 256>;

ReverseTable build_reverse(const char* alphabet, size_t length) {
    ReverseTable table;
    table.fill(kInvalid);
    for (size_t i = 0; i < length; i++) {
        table[static_cast<uint8_t>(alphabet[i])] = static_cast<int8_t>(i);
    }
    return table;
}

const ReverseTable& base64_reverse() {
    static const ReverseTable table = build_reverse(kBase64Alphabet, 64);
    return table;
}

const ReverseTable& base32_reverse() {
    static const ReverseTable table = build_reverse(kBase32Alphabet, 32);
    return table;
}

DecodeResult malformed(const std::string& message) {
    DecodeResult result;
    result.error = ErrorCode::MALFORMED_INPUT;
    result.message = message;
    result.success = false;
    return result;
}

DecodeResult decoded(std::vector<uint8_t> data) {
    DecodeResult result;
    result.data = std::move(data);
    result.success = true;
    return result;
}

// ==================== Base64 ====================

std::string encode_base64(const uint8_t* data, size_t size) {
    std::string out;
    out.reserve(((size + 2) / 3) * 4);

    size_t i = 0;
    for (; i + 3 <= size; i += 3) {
        uint32_t v = (static_cast<uint32_t>(data[i]) << 16) |
                     (static_cast<uint32_t>(data[i + 1]) << 8) |
                     static_cast<uint32_t>(data[i + 2]);
        out.push_back(kBase64Alphabet[(v >> 18) & 0x3F]);
        out.push_back(kBase64Alphabet[(v >> 12) & 0x3F]);
        out.push_back(kBase64Alphabet[(v >> 6) & 0x3F]);
        out.push_back(kBase64Alphabet[v & 0x3F]);
    }

    size_t rest = size - i;
    if (rest == 1) {
        uint32_t v = static_cast<uint32_t>(data[i]) << 16;
        out.push_back(kBase64Alphabet[(v >> 18) & 0x3F]);
        out.push_back(kBase64Alphabet[(v >> 12) & 0x3F]);
        out.append("==");
    } else if (rest == 2) {
        uint32_t v = (static_cast<uint32_t>(data[i]) << 16) |
                     (static_cast<uint32_t>(data[i + 1]) << 8);
        out.push_back(kBase64Alphabet[(v >> 18) & 0x3F]);
        out.push_back(kBase64Alphabet[(v >> 12) & 0x3F]);
        out.push_back(kBase64Alphabet[(v >> 6) & 0x3F]);
        out.push_back('=');
    }
    return out;
}

DecodeResult decode_base64(const std::string& text) {
    if (text.size() % 4 != 0) {
        return malformed("base64 length is not a multiple of 4");
    }

    const ReverseTable& table = base64_reverse();
    std::vector<uint8_t> out;
    out.reserve((text.size() / 4) * 3);

    for (size_t i = 0; i < text.size(); i += 4) {
        bool final_group = (i + 4 == text.size());
        size_t pad = 0;
        if (final_group) {
            if (text[i + 3] == '=') pad++;
            if (text[i + 2] == '=') {
                if (pad == 0) {
                    return malformed("base64 padding is not trailing");
                }
                pad++;
            }
        }

        uint32_t v = 0;
        for (size_t j = 0; j < 4; j++) {
            unsigned char c = static_cast<unsigned char>(text[i + j]);
            if (j >= 4 - pad) {
                v <<= 6;
                continue;
            }
            int8_t digit = table[c];
            if (digit == kInvalid) {
                return malformed(c == '=' ? "base64 padding inside the stream"
                                          : "character outside the base64 alphabet");
            }
            v = (v << 6) | static_cast<uint32_t>(digit);
        }

        out.push_back(static_cast<uint8_t>(v >> 16));
        if (pad < 2) out.push_back(static_cast<uint8_t>(v >> 8));
        if (pad < 1) out.push_back(static_cast<uint8_t>(v));
    }
    return decoded(std::move(out));
}

// ==================== Hex ====================

std::string encode_hex(const uint8_t* data, size_t size, bool uppercase) {
    const char* digits = uppercase ? kHexUpper : kHexLower;
    std::string out;
    out.reserve(size * 2);
    for (size_t i = 0; i < size; i++) {
        out.push_back(digits[data[i] >> 4]);
        out.push_back(digits[data[i] & 0x0F]);
    }
    return out;
}

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return kInvalid;
}

DecodeResult decode_hex(const std::string& text) {
    if (text.size() % 2 != 0) {
        return malformed("hex length is odd");
    }
    std::vector<uint8_t> out;
    out.reserve(text.size() / 2);
    for (size_t i = 0; i < text.size(); i += 2) {
        int hi = hex_value(text[i]);
        int lo = hex_value(text[i + 1]);
        if (hi == kInvalid || lo == kInvalid) {
            return malformed("character outside the hex alphabet");
        }
        out.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }
    return decoded(std::move(out));
}

// ==================== Base32 ====================

// Characters emitted for a trailing group of n raw bytes (index = n)
const size_t kBase32CharsForBytes[] = {0, 2, 4, 5, 7, 8};

std::string encode_base32(const uint8_t* data, size_t size) {
    std::string out;
    out.reserve(((size + 4) / 5) * 8);

    for (size_t i = 0; i < size; i += 5) {
        size_t n = std::min<size_t>(5, size - i);
        uint64_t v = 0;
        for (size_t j = 0; j < 5; j++) {
            v = (v << 8) | (j < n ? data[i + j] : 0);
        }
        size_t chars = kBase32CharsForBytes[n];
        for (size_t j = 0; j < 8; j++) {
            if (j < chars) {
                out.push_back(kBase32Alphabet[(v >> (35 - j * 5)) & 0x1F]);
            } else {
                out.push_back('=');
            }
        }
    }
    return out;
}

DecodeResult decode_base32(const std::string& text) {
    if (text.size() % 8 != 0) {
        return malformed("base32 length is not a multiple of 8");
    }

    const ReverseTable& table = base32_reverse();
    std::vector<uint8_t> out;
    out.reserve((text.size() / 8) * 5);

    for (size_t i = 0; i < text.size(); i += 8) {
        size_t data_chars = 8;
        while (data_chars > 0 && text[i + data_chars - 1] == '=') {
            data_chars--;
        }
        if (data_chars < 8 && i + 8 != text.size()) {
            return malformed("base32 padding inside the stream");
        }

        size_t nbytes = 0;
        switch (data_chars) {
            case 8: nbytes = 5; break;
            case 7: nbytes = 4; break;
            case 5: nbytes = 3; break;
            case 4: nbytes = 2; break;
            case 2: nbytes = 1; break;
            default:
                return malformed("invalid base32 padding length");
        }

        uint64_t v = 0;
        for (size_t j = 0; j < 8; j++) {
            v <<= 5;
            if (j >= data_chars) continue;
            int8_t digit = table[static_cast<unsigned char>(text[i + j])];
            if (digit == kInvalid) {
                return malformed("character outside the base32 alphabet");
            }
            v |= static_cast<uint64_t>(digit);
        }
        for (size_t j = 0; j < nbytes; j++) {
            out.push_back(static_cast<uint8_t>(v >> (32 - j * 8)));
        }
    }
    return decoded(std::move(out));
}

// ==================== Base85 ====================

std::string encode_base85(const uint8_t* data, size_t size) {
    std::string out;
    out.reserve((size / 4) * 5 + 5);

    for (size_t i = 0; i < size; i += 4) {
        size_t n = std::min<size_t>(4, size - i);
        uint32_t v = 0;
        for (size_t j = 0; j < 4; j++) {
            v = (v << 8) | (j < n ? data[i + j] : 0);
        }
        char group[5];
        for (int j = 4; j >= 0; j--) {
            group[j] = static_cast<char>(kBase85First + v % 85);
            v /= 85;
        }
        out.append(group, n + 1);
    }
    return out;
}

DecodeResult decode_base85(const std::string& text) {
    std::vector<uint8_t> out;
    out.reserve((text.size() / 5) * 4 + 4);

    for (size_t i = 0; i < text.size(); i += 5) {
        size_t k = std::min<size_t>(5, text.size() - i);
        if (k == 1) {
            return malformed("base85 trailing group is a single character");
        }

        uint64_t v = 0;
        for (size_t j = 0; j < 5; j++) {
            uint32_t digit = 84;  // 'u' pads a short trailing group
            if (j < k) {
                unsigned char c = static_cast<unsigned char>(text[i + j]);
                if (c < kBase85First || c > kBase85First + 84) {
                    return malformed("character outside the base85 alphabet");
                }
                digit = c - kBase85First;
            }
            v = v * 85 + digit;
        }
        if (v > 0xFFFFFFFFULL) {
            return malformed("base85 group value overflows 32 bits");
        }
        for (size_t j = 0; j < k - 1; j++) {
            out.push_back(static_cast<uint8_t>(v >> (24 - j * 8)));
        }
    }
    return decoded(std::move(out));
}

// ==================== Uuencode ====================

char uu_char(uint32_t v) {
    return v == 0 ? '`' : static_cast<char>(v + 0x20);
}

std::string encode_uuencode(const uint8_t* data, size_t size) {
    std::string out;
    out.reserve((size / 3) * 4 + 4);

    for (size_t i = 0; i < size; i += 3) {
        size_t n = std::min<size_t>(3, size - i);
        uint32_t v = 0;
        for (size_t j = 0; j < 3; j++) {
            v = (v << 8) | (j < n ? data[i + j] : 0);
        }
        for (size_t j = 0; j < n + 1; j++) {
            out.push_back(uu_char((v >> (18 - j * 6)) & 0x3F));
        }
    }
    return out;
}

DecodeResult decode_uuencode(const std::string& text) {
    std::vector<uint8_t> out;
    out.reserve((text.size() / 4) * 3 + 3);

    for (size_t i = 0; i < text.size(); i += 4) {
        size_t k = std::min<size_t>(4, text.size() - i);
        if (k == 1) {
            return malformed("uuencode trailing group is a single character");
        }

        uint32_t v = 0;
        for (size_t j = 0; j < 4; j++) {
            uint32_t digit = 0;
            if (j < k) {
                unsigned char c = static_cast<unsigned char>(text[i + j]);
                if (c < 0x20 || c > 0x60) {
                    return malformed("character outside the uuencode alphabet");
                }
                digit = (c - 0x20) & 0x3F;
            }
            v = (v << 6) | digit;
        }
        for (size_t j = 0; j < k - 1; j++) {
            out.push_back(static_cast<uint8_t>(v >> (16 - j * 8)));
        }
    }
    return decoded(std::move(out));
}

// ==================== yEnc ====================

bool yenc_reserved(uint8_t v) {
    return v == 0x00 || v == '\n' || v == '\r' || v == kYencEscape;
}

std::string encode_yenc(const uint8_t* data, size_t size) {
    std::string out;
    out.reserve(size + size / 32 + 1);
    for (size_t i = 0; i < size; i++) {
        uint8_t v = static_cast<uint8_t>(data[i] + kYencShift);
        if (yenc_reserved(v)) {
            out.push_back(static_cast<char>(kYencEscape));
            out.push_back(static_cast<char>(static_cast<uint8_t>(v + kYencEscapeShift)));
        } else {
            out.push_back(static_cast<char>(v));
        }
    }
    return out;
}

DecodeResult decode_yenc(const std::string& text) {
    std::vector<uint8_t> out;
    out.reserve(text.size());
    for (size_t i = 0; i < text.size(); i++) {
        uint8_t c = static_cast<uint8_t>(text[i]);
        if (c == kYencEscape) {
            if (i + 1 >= text.size()) {
                return malformed("yEnc stream ends with a dangling escape");
            }
            uint8_t v = static_cast<uint8_t>(static_cast<uint8_t>(text[++i]) - kYencEscapeShift);
            out.push_back(static_cast<uint8_t>(v - kYencShift));
            continue;
        }
        if (c == 0x00 || c == '\n' || c == '\r') {
            return malformed("unescaped reserved byte in yEnc stream");
        }
        out.push_back(static_cast<uint8_t>(c - kYencShift));
    }
    return decoded(std::move(out));
}

std::string to_lower(const std::string& str) {
    std::string out = str;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

} // namespace

// ==================== EncodingProfile ====================

EncodingProfile::EncodingProfile()
    : encoding(Encoding::BASE64)
    , ratio_num(1)
    , ratio_den(1)
    , raw_alignment(1)
    , fixed_ratio(true) {
}

EncodingProfile::EncodingProfile(Encoding enc, const std::string& n, uint32_t num, uint32_t den,
                                 size_t alignment, bool fixed)
    : encoding(enc)
    , name(n)
    , ratio_num(num)
    , ratio_den(den)
    , raw_alignment(alignment)
    , fixed_ratio(fixed) {
}

double EncodingProfile::expansion_ratio() const {
    return static_cast<double>(ratio_num) / static_cast<double>(ratio_den);
}

CodecOptions::CodecOptions()
    : hex_uppercase(false) {
}

DecodeResult::DecodeResult()
    : error(ErrorCode::NONE)
    , success(false) {
}

// ==================== Registry of codecs ====================

const EncodingProfile& get_profile(Encoding encoding) {
    static const EncodingProfile profiles[] = {
        EncodingProfile(Encoding::BASE64, "base64", 4, 3, 3, true),
        EncodingProfile(Encoding::HEX, "hex", 2, 1, 1, true),
        EncodingProfile(Encoding::BASE32, "base32", 8, 5, 5, true),
        EncodingProfile(Encoding::BASE85, "base85", 5, 4, 4, true),
        EncodingProfile(Encoding::UUENCODE, "uuencode", 4, 3, 3, true),
        EncodingProfile(Encoding::YENC, "yenc", 51, 50, 1, false),
    };
    return profiles[static_cast<int>(encoding)];
}

const std::vector<Encoding>& all_encodings() {
    static const std::vector<Encoding> encodings = {
        Encoding::BASE64, Encoding::HEX, Encoding::BASE32,
        Encoding::BASE85, Encoding::UUENCODE, Encoding::YENC
    };
    return encodings;
}

const std::string& encoding_name(Encoding encoding) {
    return get_profile(encoding).name;
}

std::optional<Encoding> parse_encoding(const std::string& name) {
    static const std::map<std::string, Encoding> names = {
        {"base64", Encoding::BASE64}, {"b64", Encoding::BASE64},
        {"hex", Encoding::HEX}, {"base16", Encoding::HEX},
        {"base32", Encoding::BASE32}, {"b32", Encoding::BASE32},
        {"base85", Encoding::BASE85}, {"ascii85", Encoding::BASE85}, {"a85", Encoding::BASE85},
        {"uuencode", Encoding::UUENCODE}, {"uu", Encoding::UUENCODE}, {"uue", Encoding::UUENCODE},
        {"yenc", Encoding::YENC}, {"y-enc", Encoding::YENC},
    };
    auto it = names.find(to_lower(name));
    if (it == names.end()) {
        return std::nullopt;
    }
    return it->second;
}

// ==================== Encode / Decode ====================

std::string encode(Encoding encoding, const uint8_t* data, size_t size, const CodecOptions& options) {
    switch (encoding) {
        case Encoding::BASE64: return encode_base64(data, size);
        case Encoding::HEX: return encode_hex(data, size, options.hex_uppercase);
        case Encoding::BASE32: return encode_base32(data, size);
        case Encoding::BASE85: return encode_base85(data, size);
        case Encoding::UUENCODE: return encode_uuencode(data, size);
        case Encoding::YENC: return encode_yenc(data, size);
    }
    return std::string();
}

std::string encode(Encoding encoding, const std::vector<uint8_t>& data, const CodecOptions& options) {
    return encode(encoding, data.data(), data.size(), options);
}

DecodeResult decode(Encoding encoding, const std::string& text) {
    switch (encoding) {
        case Encoding::BASE64: return decode_base64(text);
        case Encoding::HEX: return decode_hex(text);
        case Encoding::BASE32: return decode_base32(text);
        case Encoding::BASE85: return decode_base85(text);
        case Encoding::UUENCODE: return decode_uuencode(text);
        case Encoding::YENC: return decode_yenc(text);
    }
    return malformed("unknown encoding");
}

uint64_t estimate_encoded_size(Encoding encoding, uint64_t raw_size) {
    switch (encoding) {
        case Encoding::BASE64: return ((raw_size + 2) / 3) * 4;
        case Encoding::HEX: return raw_size * 2;
        case Encoding::BASE32: return ((raw_size + 4) / 5) * 8;
        case Encoding::BASE85: {
            uint64_t rest = raw_size % 4;
            return (raw_size / 4) * 5 + (rest ? rest + 1 : 0);
        }
        case Encoding::UUENCODE: {
            uint64_t rest = raw_size % 3;
            return (raw_size / 3) * 4 + (rest ? rest + 1 : 0);
        }
        case Encoding::YENC: {
            const EncodingProfile& p = get_profile(encoding);
            return (raw_size * p.ratio_num + p.ratio_den - 1) / p.ratio_den;
        }
    }
    return raw_size;
}

} // namespace encache
