#pragma once
#include <cstdint>
#include <string_view>

namespace scidata::consts {

// Reserved root items
inline constexpr std::string_view kContentItem = "content.json";
inline constexpr std::string_view kMetaItem    = "meta.json";
inline constexpr std::string_view kLicenseItem = "license.txt";

// Archive file extension
inline constexpr std::string_view kArchiveExt  = ".zdc";

// Schema version stamped into content.json
inline constexpr std::string_view kModelVersion = "1.0";

// ——— Digest sizes ———
inline constexpr std::size_t kDigestRawLen = 32; // 32 bytes (SHA-256)
inline constexpr std::size_t kDigestHexLen = 64; // 64 hex chars (SHA-256)

// ——— Remote store layout ———
inline constexpr std::string_view kRecordsDir  = "records";
inline constexpr std::string_view kArchivesDir = "archives";
inline constexpr std::string_view kStaticDir   = "static";
inline constexpr std::size_t kFanoutDirLen     = 2; // "ab/" + "abcdef..." in archives/

// Longest replaces-chain followed by download()
inline constexpr int kMaxRedirects = 64;

// ——— Port number / timeout ———
inline constexpr int portNumber = 9419;
inline constexpr int kDefaultTimeoutMs = 30000;

// ——— Common characters ———
inline constexpr char kSpace = ' ';
inline constexpr char kNul   = '\0';
inline constexpr char kLF    = '\n';

// ——— Store protocol ———
inline constexpr std::string_view kHelloLine  = "HELLO 1";
inline constexpr std::string_view kOpCreate   = "OP CREATE";
inline constexpr std::string_view kOpReplace  = "OP REPLACE ";
inline constexpr std::string_view kOpGet      = "OP GET ";
inline constexpr std::string_view kOpFind     = "OP FIND ";
inline constexpr std::string_view kTokAuth    = "AUTH ";
inline constexpr std::string_view kTokData    = "DATA ";
inline constexpr std::string_view kTokRedirect = "REDIRECT ";
inline constexpr std::string_view kTokNone    = "NONE";
inline constexpr std::string_view kTokOk      = "OK";
inline constexpr std::string_view kTokErr     = "ERR ";
} // namespace scidata::consts
