#ifndef ENCODING_CODEC_HPP
#define ENCODING_CODEC_HPP

#include "errors.hpp"
#include <string>
#include <vector>
#include <cstdint>
#include <cstddef>
#include <optional>

namespace encache {

/**
 * Supported text encodings (closed set)
 */
enum class Encoding {
    BASE64,     // RFC 4648, '=' padding
    HEX,        // Base16
    BASE32,     // RFC 4648, '=' padding
    BASE85,     // Ascii85 digits, no 'z' shorthand
    UUENCODE,   // Unframed uuencode body
    YENC        // Escaped single-byte shift
};

/**
 * Static description of a codec
 *
 * The expansion ratio is kept as an exact fraction so chunk planning never
 * depends on floating point rounding. For yEnc the ratio is a nominal upper
 * bound: the real expansion depends on how often escapes occur.
 */
struct EncodingProfile {
    Encoding encoding;
    std::string name;
    uint32_t ratio_num;       // Encoded bytes ...
    uint32_t ratio_den;       // ... per this many raw bytes
    size_t raw_alignment;     // Raw bytes the codec consumes as one group
    bool fixed_ratio;         // False when output size is data dependent

    EncodingProfile();
    EncodingProfile(Encoding enc, const std::string& n, uint32_t num, uint32_t den,
                    size_t alignment, bool fixed);

    double expansion_ratio() const;
};

/**
 * Codec knobs that do not change the decoded bytes
 */
struct CodecOptions {
    bool hex_uppercase;

    CodecOptions();
};

/**
 * Result of a decode call
 */
struct DecodeResult {
    std::vector<uint8_t> data;
    ErrorCode error;
    std::string message;
    bool success;

    DecodeResult();
};

/**
 * Profile lookup for a codec
 */
const EncodingProfile& get_profile(Encoding encoding);

/**
 * All codecs in declaration order
 */
const std::vector<Encoding>& all_encodings();

/**
 * Canonical lower-case name ("base64", "hex", ...)
 */
const std::string& encoding_name(Encoding encoding);

/**
 * Parse a codec name, case-insensitive, aliases accepted
 * @return nullopt for unknown names
 */
std::optional<Encoding> parse_encoding(const std::string& name);

/**
 * Encode raw bytes
 * Output of consecutive aligned windows concatenates to the output of the
 * whole buffer, so chunks can be encoded independently.
 */
std::string encode(Encoding encoding, const uint8_t* data, size_t size,
                   const CodecOptions& options = CodecOptions());

std::string encode(Encoding encoding, const std::vector<uint8_t>& data,
                   const CodecOptions& options = CodecOptions());

/**
 * Decode text back to raw bytes
 * Fails with MALFORMED_INPUT on characters outside the alphabet, invalid
 * padding or a dangling yEnc escape.
 */
DecodeResult decode(Encoding encoding, const std::string& text);

/**
 * Encoded size of raw_size bytes
 * Exact for fixed-ratio codecs, nominal upper bound for yEnc.
 */
uint64_t estimate_encoded_size(Encoding encoding, uint64_t raw_size);

} // namespace encache

#endif // ENCODING_CODEC_HPP
