#include "scidata/codecs.hpp"

#include "scidata/errors.hpp"
#include "scidata/hash.hpp"

#include <cstring>
#include <memory>
#include <sstream>
#include <string>

namespace scidata {

namespace {

std::string_view as_chars(std::span<const std::uint8_t> bytes) {
  return {reinterpret_cast<const char *>(bytes.data()), bytes.size()};
}

Bytes to_bytes(std::string_view s) { return Bytes(s.begin(), s.end()); }

// ——— .npy header helpers ———

constexpr std::string_view kNpyMagic = "\x93NUMPY";
constexpr std::size_t kNpyAlign = 64;

std::string shape_tuple(const std::vector<std::size_t> &shape) {
  std::ostringstream os;
  os << '(';
  for (std::size_t i = 0; i < shape.size(); ++i) {
    if (i)
      os << ", ";
    os << shape[i];
  }
  if (shape.size() == 1)
    os << ',';
  os << ')';
  return os.str();
}

std::size_t element_count(const std::vector<std::size_t> &shape) {
  std::size_t n = 1;
  for (auto d : shape)
    n *= d;
  return n;
}

// Value following `'key':` in the header dict, up to the next top-level
// comma; tuples are returned including parentheses.
std::string_view header_field(std::string_view header, std::string_view key) {
  const std::string quoted = "'" + std::string(key) + "'";
  auto pos = header.find(quoted);
  if (pos == std::string_view::npos)
    throw CorruptArchive("npy header lacks " + quoted);
  pos = header.find(':', pos + quoted.size());
  if (pos == std::string_view::npos)
    throw CorruptArchive("npy header malformed at " + quoted);
  ++pos;
  while (pos < header.size() && header[pos] == ' ')
    ++pos;

  std::size_t end = pos;
  if (pos < header.size() && header[pos] == '(') {
    end = header.find(')', pos);
    if (end == std::string_view::npos)
      throw CorruptArchive("npy header: unterminated shape");
    return header.substr(pos, end - pos + 1);
  }
  while (end < header.size() && header[end] != ',' && header[end] != '}')
    ++end;
  auto value = header.substr(pos, end - pos);
  while (!value.empty() && value.back() == ' ')
    value.remove_suffix(1);
  return value;
}

std::vector<std::size_t> parse_shape(std::string_view tuple) {
  std::vector<std::size_t> shape;
  std::size_t i = 1; // skip '('
  while (i < tuple.size()) {
    while (i < tuple.size() && (tuple[i] == ' ' || tuple[i] == ','))
      ++i;
    if (i >= tuple.size() || tuple[i] == ')')
      break;
    std::size_t v = 0;
    bool any = false;
    while (i < tuple.size() && tuple[i] >= '0' && tuple[i] <= '9') {
      v = v * 10 + static_cast<std::size_t>(tuple[i] - '0');
      ++i;
      any = true;
    }
    if (!any)
      throw CorruptArchive("npy header: bad shape " + std::string(tuple));
    shape.push_back(v);
  }
  return shape;
}

} // namespace

// ——— JSON ———

Bytes JsonCodec::encode(const Value &value) const { return to_bytes(value.as_json().dump(4)); }

Value JsonCodec::decode(std::span<const std::uint8_t> bytes) const {
  try {
    return Value(Json::parse(as_chars(bytes)));
  } catch (const Json::parse_error &e) {
    throw CorruptArchive(std::string("invalid JSON item: ") + e.what());
  }
}

std::string JsonCodec::hash(std::span<const std::uint8_t> bytes) const {
  const auto canonical = decode(bytes).as_json().dump();
  return to_hex(sha256(canonical));
}

// ——— Text ———

Bytes TextCodec::encode(const Value &value) const { return to_bytes(value.as_text()); }

Value TextCodec::decode(std::span<const std::uint8_t> bytes) const {
  return std::string(as_chars(bytes));
}

// ——— NumPy ———

std::size_t dtype_size(std::string_view dtype) {
  if (dtype.size() < 2)
    return 0;
  const char order = dtype.front();
  if (order != '<' && order != '|' && order != '>' && order != '=')
    return 0;
  auto body = dtype.substr(1);
  std::size_t size = 0;
  if (body == "b1" || body == "u1" || body == "i1")
    size = 1;
  else if (body == "u2" || body == "i2" || body == "f2")
    size = 2;
  else if (body == "u4" || body == "i4" || body == "f4")
    size = 4;
  else if (body == "u8" || body == "i8" || body == "f8" || body == "c8")
    size = 8;
  else if (body == "c16")
    size = 16;
  else
    return 0;
  // Multi-byte data is stored little-endian only.
  if (size > 1 && order != '<')
    return 0;
  return size;
}

Bytes NpyCodec::encode(const Value &value) const {
  const auto &arr = value.as_array();
  const auto elsize = dtype_size(arr.dtype);
  if (elsize == 0)
    throw UnsupportedFormat("npy: unsupported dtype '" + arr.dtype + "'");
  if (arr.data.size() != element_count(arr.shape) * elsize)
    throw UnsupportedFormat("npy: data size does not match shape and dtype");

  std::string header = "{'descr': '" + arr.dtype +
                       "', 'fortran_order': False, 'shape': " + shape_tuple(arr.shape) + ", }";
  // magic(6) + version(2) + header length(2) + header, padded to 64 with a final '\n'
  const std::size_t unpadded = kNpyMagic.size() + 2 + 2 + header.size() + 1;
  header.append((kNpyAlign - unpadded % kNpyAlign) % kNpyAlign, ' ');
  header.push_back('\n');
  if (header.size() > 0xFFFF)
    throw UnsupportedFormat("npy: header too long");

  Bytes out;
  out.reserve(kNpyMagic.size() + 4 + header.size() + arr.data.size());
  out.insert(out.end(), kNpyMagic.begin(), kNpyMagic.end());
  out.push_back(1); // major
  out.push_back(0); // minor
  out.push_back(static_cast<std::uint8_t>(header.size() & 0xFF));
  out.push_back(static_cast<std::uint8_t>((header.size() >> 8) & 0xFF));
  out.insert(out.end(), header.begin(), header.end());
  out.insert(out.end(), arr.data.begin(), arr.data.end());
  return out;
}

Value NpyCodec::decode(std::span<const std::uint8_t> bytes) const {
  if (bytes.size() < 10 || as_chars(bytes.first(kNpyMagic.size())) != kNpyMagic)
    throw CorruptArchive("npy: bad magic");

  const std::uint8_t major = bytes[6];
  std::size_t header_len = 0;
  std::size_t offset = 0;
  if (major == 1) {
    header_len = static_cast<std::size_t>(bytes[8]) | (static_cast<std::size_t>(bytes[9]) << 8);
    offset = 10;
  } else if (major == 2 || major == 3) {
    if (bytes.size() < 12)
      throw CorruptArchive("npy: truncated header");
    header_len = static_cast<std::size_t>(bytes[8]) | (static_cast<std::size_t>(bytes[9]) << 8) |
                 (static_cast<std::size_t>(bytes[10]) << 16) |
                 (static_cast<std::size_t>(bytes[11]) << 24);
    offset = 12;
  } else {
    throw UnsupportedFormat("npy: unsupported format version " + std::to_string(major));
  }
  if (offset + header_len > bytes.size())
    throw CorruptArchive("npy: truncated header");

  const auto header = as_chars(bytes.subspan(offset, header_len));
  NdArray arr;
  auto descr = header_field(header, "descr");
  if (descr.size() < 2 || descr.front() != '\'' || descr.back() != '\'')
    throw CorruptArchive("npy: bad descr");
  arr.dtype = std::string(descr.substr(1, descr.size() - 2));
  if (header_field(header, "fortran_order") != "False")
    throw UnsupportedFormat("npy: Fortran order is not supported");
  arr.shape = parse_shape(header_field(header, "shape"));

  const auto elsize = dtype_size(arr.dtype);
  if (elsize == 0)
    throw UnsupportedFormat("npy: unsupported dtype '" + arr.dtype + "'");
  const auto data = bytes.subspan(offset + header_len);
  if (data.size() != element_count(arr.shape) * elsize)
    throw CorruptArchive("npy: data size does not match shape");
  arr.data.assign(data.begin(), data.end());
  return arr;
}

void register_builtin_codecs(CodecRegistry &registry) {
  registry.register_codec("json", std::make_shared<JsonCodec>(), ValueKind::Json);
  registry.register_codec("txt", std::make_shared<TextCodec>(), ValueKind::Text);
  registry.register_alias("log", "txt");
  registry.register_alias("pgm", "txt");
  registry.register_codec("bin", std::make_shared<BinaryCodec>(), ValueKind::Bytes);
  registry.register_codec("npy", std::make_shared<NpyCodec>(), ValueKind::Array);
}

} // namespace scidata
