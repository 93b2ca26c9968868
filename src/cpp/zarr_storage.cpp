#include "celio/io/zarr_storage.hpp"
#include "celio/io/chunking.hpp"
#include "celio/io/codec.hpp"

#include <algorithm>
#include <bit>
#include <cmath>
#include <cstring>
#include <fstream>
#include <limits>
#include <map>
#include <utility>

namespace celio {

namespace fs = std::filesystem;
using nlohmann::json;

static_assert(std::endian::native == std::endian::little,
              "zarr chunks are written from native little-endian buffers");

namespace {

constexpr const char* kZGroup = ".zgroup";
constexpr const char* kZArray = ".zarray";
constexpr const char* kZAttrs = ".zattrs";

// =============================================================================
// Files
// =============================================================================

std::vector<Byte> read_file(const fs::path& p) {
    std::ifstream in(p, std::ios::binary);
    if (!in) throw ReadError("cannot open '" + p.string() + "'");
    in.seekg(0, std::ios::end);
    const auto size = static_cast<std::streamsize>(in.tellg());
    in.seekg(0, std::ios::beg);
    std::vector<Byte> buf(static_cast<Size>(size));
    if (size > 0 && !in.read(reinterpret_cast<char*>(buf.data()), size)) {
        throw ReadError("failed reading '" + p.string() + "'");
    }
    return buf;
}

void write_file(const fs::path& p, std::span<const Byte> bytes) {
    std::ofstream out(p, std::ios::binary | std::ios::trunc);
    if (!out) throw WriteError("cannot create '" + p.string() + "'");
    out.write(reinterpret_cast<const char*>(bytes.data()),
              static_cast<std::streamsize>(bytes.size()));
    if (!out) throw WriteError("failed writing '" + p.string() + "'");
}

json read_json(const fs::path& p) {
    std::ifstream in(p);
    if (!in) throw ReadError("cannot open '" + p.string() + "'");
    try {
        return json::parse(in);
    } catch (const json::parse_error& e) {
        throw ReadError("malformed JSON in '" + p.string() + "': " + e.what());
    }
}

void write_json(const fs::path& p, const json& doc) {
    std::ofstream out(p, std::ios::trunc);
    if (!out) throw WriteError("cannot create '" + p.string() + "'");
    out << doc.dump(4);
    if (!out) throw WriteError("failed writing '" + p.string() + "'");
}

bool is_zgroup(const fs::path& dir) { return fs::is_regular_file(dir / kZGroup); }
bool is_zarray(const fs::path& dir) { return fs::is_regular_file(dir / kZArray); }

std::string join_rel(const std::string& rel, const std::string& key) {
    return rel.empty() ? key : rel + "/" + key;
}

// =============================================================================
// Attributes (.zattrs)
// =============================================================================

json load_attrs(const fs::path& dir) {
    const fs::path p = dir / kZAttrs;
    if (!fs::exists(p)) return json::object();
    json doc = read_json(p);
    if (!doc.is_object()) {
        throw ReadError("'" + p.string() + "' does not hold a JSON object");
    }
    return doc;
}

json attr_to_json(const AttrValue& value) {
    return std::visit([](const auto& v) { return json(v); }, value);
}

// null is treated as an absent attribute; an empty list reads as a string list
std::optional<AttrValue> json_to_attr(const json& j, const std::string& name) {
    switch (j.type()) {
        case json::value_t::null:
            return std::nullopt;
        case json::value_t::boolean:
            return AttrValue{j.get<bool>()};
        case json::value_t::number_integer:
        case json::value_t::number_unsigned:
            return AttrValue{j.get<std::int64_t>()};
        case json::value_t::number_float:
            return AttrValue{j.get<double>()};
        case json::value_t::string:
            return AttrValue{j.get<std::string>()};
        case json::value_t::array: {
            if (j.empty()) return AttrValue{std::vector<std::string>{}};
            bool all_str = true;
            bool all_int = true;
            bool all_num = true;
            for (const auto& e : j) {
                all_str = all_str && e.is_string();
                all_int = all_int && e.is_number_integer();
                all_num = all_num && e.is_number();
            }
            if (all_str) return AttrValue{j.get<std::vector<std::string>>()};
            if (all_int) return AttrValue{j.get<std::vector<std::int64_t>>()};
            if (all_num) return AttrValue{j.get<std::vector<double>>()};
            break;
        }
        default:
            break;
    }
    throw TypeError("unsupported zarr attribute value for '" + name + "'");
}

bool node_has_attr(const fs::path& dir, const std::string& name) {
    const json attrs = load_attrs(dir);
    const auto it = attrs.find(name);
    return it != attrs.end() && !it->is_null();
}

std::optional<AttrValue> node_get_attr(const fs::path& dir, const std::string& name) {
    const json attrs = load_attrs(dir);
    const auto it = attrs.find(name);
    if (it == attrs.end()) return std::nullopt;
    return json_to_attr(*it, name);
}

void node_set_attr(const fs::path& dir, const std::string& name, const AttrValue& value) {
    json attrs = load_attrs(dir);
    attrs[name] = attr_to_json(value);
    write_json(dir / kZAttrs, attrs);
}

std::vector<std::string> node_attr_names(const fs::path& dir) {
    const json attrs = load_attrs(dir);
    std::vector<std::string> names;
    for (const auto& [key, value] : attrs.items()) {
        if (!value.is_null()) names.push_back(key);
    }
    return names;
}

// =============================================================================
// Dtypes
// =============================================================================

/// One numpy-style type string ("<f8", "|O", "<U5", ...).
struct FieldType {
    char order = '|';       // '<', '>' or '|'
    char kind = 'f';        // b i u f | O (vlen text) | U (UTF-32) | S (bytes) | V (raw rows)
    Size width = 0;         // bytes per element, 0 for object
    DType dtype = DType::Float64;

    [[nodiscard]] bool is_text() const noexcept {
        return kind == 'O' || kind == 'U' || kind == 'S';
    }
};

FieldType parse_type(const std::string& s) {
    if (s.size() < 2) throw FeatureUnavailableError("unsupported zarr dtype '" + s + "'");
    FieldType t;
    t.order = s[0] == '=' ? '<' : s[0];
    t.kind = s[1];
    if (t.order != '<' && t.order != '>' && t.order != '|') {
        throw FeatureUnavailableError("unsupported zarr dtype '" + s + "'");
    }

    Size n = 0;
    if (s.size() > 2) {
        try {
            n = static_cast<Size>(std::stoul(s.substr(2)));
        } catch (const std::exception&) {
            throw FeatureUnavailableError("unsupported zarr dtype '" + s + "'");
        }
    }

    auto pick = [&](std::initializer_list<std::pair<Size, DType>> widths) {
        for (const auto& [w, d] : widths) {
            if (w == n) {
                t.width = w;
                t.dtype = d;
                return t;
            }
        }
        throw FeatureUnavailableError("unsupported zarr dtype '" + s + "'");
    };

    switch (t.kind) {
        case 'b': return pick({{1, DType::Bool}});
        case 'i': return pick({{1, DType::Int8}, {2, DType::Int16}, {4, DType::Int32}, {8, DType::Int64}});
        case 'u': return pick({{1, DType::UInt8}, {2, DType::UInt16}, {4, DType::UInt32}, {8, DType::UInt64}});
        case 'f': return pick({{4, DType::Float32}, {8, DType::Float64}});
        case 'O':
            t.dtype = DType::String;
            return t;
        case 'U':
            t.width = 4 * n;
            t.dtype = DType::String;
            return t;
        case 'S':
            t.width = n;
            t.dtype = DType::String;
            return t;
        default:
            break;
    }
    throw FeatureUnavailableError("unsupported zarr dtype '" + s + "'");
}

std::string format_type(DType d) {
    switch (d) {
        case DType::Bool:    return "|b1";
        case DType::Int8:    return "|i1";
        case DType::Int16:   return "<i2";
        case DType::Int32:   return "<i4";
        case DType::Int64:   return "<i8";
        case DType::UInt8:   return "|u1";
        case DType::UInt16:  return "<u2";
        case DType::UInt32:  return "<u4";
        case DType::UInt64:  return "<u8";
        case DType::Float32: return "<f4";
        case DType::Float64: return "<f8";
        case DType::String:
        case DType::Object:  return "|O";
    }
    throw InternalError("unknown dtype");
}

json default_fill(DType d) {
    if (is_text(d)) return nullptr;
    if (d == DType::Bool) return false;
    if (is_floating(d)) return 0.0;
    return 0;
}

double fill_number(const json& fill) {
    if (fill.is_boolean()) return fill.get<bool>() ? 1.0 : 0.0;
    if (fill.is_number()) return fill.get<double>();
    if (fill.is_string()) {
        const auto s = fill.get<std::string>();
        if (s == "NaN") return std::numeric_limits<double>::quiet_NaN();
        if (s == "Infinity") return std::numeric_limits<double>::infinity();
        if (s == "-Infinity") return -std::numeric_limits<double>::infinity();
    }
    return 0.0;
}

// =============================================================================
// UTF-8 <-> UTF-32
// =============================================================================

std::u32string utf8_to_utf32(const std::string& s) {
    std::u32string out;
    out.reserve(s.size());
    for (Size i = 0; i < s.size();) {
        const auto c = static_cast<unsigned char>(s[i]);
        Size len = 1;
        char32_t cp = 0;
        if (c < 0x80) {
            cp = c;
        } else if ((c >> 5) == 0x6) {
            cp = c & 0x1F;
            len = 2;
        } else if ((c >> 4) == 0xE) {
            cp = c & 0x0F;
            len = 3;
        } else if ((c >> 3) == 0x1E) {
            cp = c & 0x07;
            len = 4;
        } else {
            throw ValueError("invalid UTF-8 lead byte in string value");
        }
        if (i + len > s.size()) throw ValueError("truncated UTF-8 sequence in string value");
        for (Size k = 1; k < len; ++k) {
            const auto cc = static_cast<unsigned char>(s[i + k]);
            if ((cc >> 6) != 0x2) throw ValueError("invalid UTF-8 continuation byte in string value");
            cp = (cp << 6) | (cc & 0x3F);
        }
        out.push_back(cp);
        i += len;
    }
    return out;
}

void append_utf8(std::string& out, char32_t cp) {
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x110000) {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        throw ReadError("code point out of range in UTF-32 string");
    }
}

/// Decode one fixed-width text cell ('U' or 'S'), dropping trailing padding.
std::string decode_fixed(const FieldType& t, const Byte* p) {
    std::string out;
    if (t.kind == 'S') {
        const Byte* end = std::find(p, p + t.width, Byte{0});
        out.assign(reinterpret_cast<const char*>(p), static_cast<Size>(end - p));
        return out;
    }
    for (Size i = 0; i < t.width / 4; ++i) {
        Byte unit[4];
        std::memcpy(unit, p + 4 * i, 4);
        if (t.order == '>') std::reverse(unit, unit + 4);
        std::uint32_t cp = 0;
        std::memcpy(&cp, unit, 4);
        if (cp == 0) break;
        append_utf8(out, static_cast<char32_t>(cp));
    }
    return out;
}

void encode_utf32(const std::u32string& s, Byte* p, Size width) {
    std::memset(p, 0, width);
    for (Size i = 0; i < s.size() && 4 * i < width; ++i) {
        const auto cp = static_cast<std::uint32_t>(s[i]);
        std::memcpy(p + 4 * i, &cp, 4);
    }
}

// =============================================================================
// Chunk payloads
// =============================================================================

void byteswap_elements(std::vector<Byte>& bytes, Size width) {
    if (width <= 1) return;
    for (Size i = 0; i + width <= bytes.size(); i += width) {
        std::reverse(bytes.begin() + static_cast<std::ptrdiff_t>(i),
                     bytes.begin() + static_cast<std::ptrdiff_t>(i + width));
    }
}

std::vector<Byte> shuffle_bytes(const std::vector<Byte>& in, Size es) {
    std::vector<Byte> out(in.size());
    const Size count = in.size() / es;
    for (Size i = 0; i < count; ++i) {
        for (Size j = 0; j < es; ++j) out[j * count + i] = in[i * es + j];
    }
    std::copy(in.begin() + static_cast<std::ptrdiff_t>(count * es), in.end(),
              out.begin() + static_cast<std::ptrdiff_t>(count * es));
    return out;
}

std::vector<Byte> unshuffle_bytes(const std::vector<Byte>& in, Size es) {
    std::vector<Byte> out(in.size());
    const Size count = in.size() / es;
    for (Size i = 0; i < count; ++i) {
        for (Size j = 0; j < es; ++j) out[i * es + j] = in[j * count + i];
    }
    std::copy(in.begin() + static_cast<std::ptrdiff_t>(count * es), in.end(),
              out.begin() + static_cast<std::ptrdiff_t>(count * es));
    return out;
}

// vlen-utf8: u32 item count, then (u32 byte length, bytes) per item, little-endian
std::vector<Byte> encode_vlen(const std::vector<std::string>& items) {
    Size total = 4;
    for (const auto& s : items) total += 4 + s.size();
    std::vector<Byte> out(total);
    Byte* p = out.data();
    auto put = [&p](std::uint32_t v) {
        std::memcpy(p, &v, 4);
        p += 4;
    };
    put(static_cast<std::uint32_t>(items.size()));
    for (const auto& s : items) {
        put(static_cast<std::uint32_t>(s.size()));
        std::memcpy(p, s.data(), s.size());
        p += s.size();
    }
    return out;
}

std::vector<std::string> decode_vlen(const std::vector<Byte>& bytes, Size nitems) {
    Size pos = 0;
    auto get = [&]() {
        if (pos + 4 > bytes.size()) throw ReadError("truncated vlen-utf8 chunk");
        std::uint32_t v = 0;
        std::memcpy(&v, bytes.data() + pos, 4);
        pos += 4;
        return static_cast<Size>(v);
    };
    const Size n = get();
    if (n != nitems) {
        throw ReadError("vlen-utf8 chunk holds " + std::to_string(n) + " items, expected " +
                        std::to_string(nitems));
    }
    std::vector<std::string> out;
    out.reserve(n);
    for (Size i = 0; i < n; ++i) {
        const Size len = get();
        if (pos + len > bytes.size()) throw ReadError("truncated vlen-utf8 chunk");
        out.emplace_back(reinterpret_cast<const char*>(bytes.data() + pos), len);
        pos += len;
    }
    return out;
}

struct ChunkData {
    std::vector<Byte> bytes;            // fixed-width elements, native order
    std::vector<std::string> strings;   // text elements
};

ChunkData fill_chunk(const zarr::ArrayMeta& m, const FieldType& t, Size nitems) {
    ChunkData out;
    if (t.is_text()) {
        out.strings.resize(nitems);
        return out;
    }
    out.bytes.assign(nitems * t.width, 0);
    if (t.kind == 'V') return out;

    const double fill = fill_number(m.fill_value);
    if (fill != 0.0) {
        visit_numeric(t.dtype, [&](auto zero) {
            using T = decltype(zero);
            const T v = static_cast<T>(fill);
            for (Size i = 0; i < nitems; ++i) {
                std::memcpy(out.bytes.data() + i * sizeof(T), &v, sizeof(T));
            }
        });
    }
    return out;
}

std::string chunk_key(const std::vector<Size>& cidx, char sep) {
    if (cidx.empty()) return "0";
    std::string key;
    for (Size i = 0; i < cidx.size(); ++i) {
        if (i > 0) key.push_back(sep);
        key += std::to_string(cidx[i]);
    }
    return key;
}

ChunkData load_chunk(const fs::path& dir, const zarr::ArrayMeta& m, const FieldType& t,
                     const std::vector<Size>& cidx, Size nitems)
{
    const fs::path file = dir / chunk_key(cidx, m.separator);
    if (!fs::exists(file)) return fill_chunk(m, t, nitems);

    const Size expected = t.kind == 'O' ? 0 : nitems * t.width;
    std::vector<Byte> bytes = codec::decompress(m.compressor, read_file(file), expected);
    if (m.shuffle > 0) bytes = unshuffle_bytes(bytes, m.shuffle);

    ChunkData out;
    if (t.kind == 'O') {
        if (!m.vlen_utf8) {
            throw FeatureUnavailableError("object arrays without the vlen-utf8 filter are not supported");
        }
        out.strings = decode_vlen(bytes, nitems);
        return out;
    }
    if (bytes.size() != expected) {
        throw ReadError("chunk '" + file.string() + "' holds " + std::to_string(bytes.size()) +
                        " bytes, expected " + std::to_string(expected));
    }
    if (t.kind == 'U' || t.kind == 'S') {
        out.strings.reserve(nitems);
        for (Size i = 0; i < nitems; ++i) {
            out.strings.push_back(decode_fixed(t, bytes.data() + i * t.width));
        }
        return out;
    }
    if (t.order == '>') byteswap_elements(bytes, t.width);
    out.bytes = std::move(bytes);
    return out;
}

void store_chunk(const fs::path& dir, const zarr::ArrayMeta& m,
                 const std::vector<Size>& cidx, std::vector<Byte> bytes)
{
    if (m.shuffle > 0) bytes = shuffle_bytes(bytes, m.shuffle);
    const auto encoded = codec::compress(m.compressor, m.level, bytes);
    const fs::path file = dir / chunk_key(cidx, m.separator);
    if (m.separator == '/') fs::create_directories(file.parent_path());
    write_file(file, encoded);
}

// =============================================================================
// Chunk geometry
// =============================================================================

Size product(const std::vector<Size>& v) {
    Size n = 1;
    for (Size x : v) n *= x;
    return n;
}

std::vector<Size> strides_of(const std::vector<Size>& shape) {
    std::vector<Size> s(shape.size(), 1);
    for (Size i = shape.size(); i-- > 1;) s[i - 1] = s[i] * shape[i];
    return s;
}

/// Advance an odometer over `limits` (last axis fastest); false when wrapped.
bool advance(std::vector<Size>& counter, const std::vector<Size>& limits) {
    for (Size ax = counter.size(); ax-- > 0;) {
        if (++counter[ax] < limits[ax]) return true;
        counter[ax] = 0;
    }
    return false;
}

template <typename F>
void for_each_chunk(const std::vector<Size>& shape, const std::vector<Size>& chunks, F&& f) {
    const auto grid = chunk_grid(shape, chunks);
    if (std::find(grid.begin(), grid.end(), Size{0}) != grid.end()) return;
    std::vector<Size> cidx(grid.size(), 0);
    do {
        f(cidx);
    } while (advance(cidx, grid));
}

/// Visit the overlap of a chunk with the array as contiguous runs along the
/// last axis: f(chunk_offset, array_offset, run_length), offsets in elements.
template <typename F>
void for_each_run(const std::vector<Size>& shape, const std::vector<Size>& chunks,
                  const std::vector<Size>& cidx, F&& f)
{
    const Size rank = shape.size();
    if (rank == 0) {
        f(Size{0}, Size{0}, Size{1});
        return;
    }

    std::vector<Size> origin(rank);
    std::vector<Size> extent(rank);
    for (Size ax = 0; ax < rank; ++ax) {
        origin[ax] = cidx[ax] * chunks[ax];
        extent[ax] = std::min(chunks[ax], shape[ax] - origin[ax]);
        if (extent[ax] == 0) return;
    }
    const auto cstride = strides_of(chunks);
    const auto astride = strides_of(shape);

    // the last axis is covered by the run itself
    std::vector<Size> outer(extent.begin(), extent.end() - 1);
    std::vector<Size> local(rank - 1, 0);
    do {
        Size c = 0;
        Size a = origin[rank - 1] * astride[rank - 1];
        for (Size ax = 0; ax + 1 < rank; ++ax) {
            c += local[ax] * cstride[ax];
            a += (origin[ax] + local[ax]) * astride[ax];
        }
        f(c, a, extent[rank - 1]);
    } while (advance(local, outer));
}

std::vector<Size> choose_chunks(const std::vector<Size>& shape, Size itemsize,
                                const WriteOptions& options)
{
    // zarr stores scalars as a single chunk "0" with empty chunk shape
    if (shape.empty()) return {};

    std::vector<Size> chunks = options.chunks;
    if (chunks.empty()) {
        chunks = guess_chunks(shape, itemsize);
    } else if (chunks.size() != shape.size()) {
        throw ValueError("chunk shape rank " + std::to_string(chunks.size()) +
                         " does not match array rank " + std::to_string(shape.size()));
    }
    for (Size i = 0; i < shape.size(); ++i) {
        if (!options.resizable && shape[i] > 0) chunks[i] = std::min(chunks[i], shape[i]);
        chunks[i] = std::max<Size>(chunks[i], 1);
    }
    return chunks;
}

zarr::ArrayMeta make_meta(const std::vector<Size>& shape, Size itemsize,
                          const WriteOptions& options)
{
    zarr::ArrayMeta m;
    m.shape = shape;
    m.chunks = choose_chunks(shape, itemsize, options);
    m.compressor = options.compression;
    m.level = options.level;
    return m;
}

void write_fixed(const fs::path& dir, const zarr::ArrayMeta& m, const Byte* src, Size width) {
    const Size nitems = product(m.chunks);
    for_each_chunk(m.shape, m.chunks, [&](const std::vector<Size>& cidx) {
        std::vector<Byte> buf(nitems * width, 0);
        for_each_run(m.shape, m.chunks, cidx, [&](Size c, Size a, Size run) {
            std::memcpy(buf.data() + c * width, src + a * width, run * width);
        });
        store_chunk(dir, m, cidx, std::move(buf));
    });
}

void write_vlen(const fs::path& dir, const zarr::ArrayMeta& m,
                const std::vector<std::string>& src)
{
    const Size nitems = product(m.chunks);
    for_each_chunk(m.shape, m.chunks, [&](const std::vector<Size>& cidx) {
        std::vector<std::string> cells(nitems);
        for_each_run(m.shape, m.chunks, cidx, [&](Size c, Size a, Size run) {
            for (Size k = 0; k < run; ++k) cells[c + k] = src[a + k];
        });
        store_chunk(dir, m, cidx, encode_vlen(cells));
    });
}

void create_node_dir(const fs::path& dir) {
    if (is_zgroup(dir) || is_zarray(dir)) {
        throw WriteError("node '" + dir.string() + "' already exists");
    }
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) throw WriteError("cannot create '" + dir.string() + "': " + ec.message());
}

} // namespace

// =============================================================================
// ArrayMeta
// =============================================================================

namespace zarr {

ArrayMeta ArrayMeta::load(const fs::path& dir) {
    const json doc = read_json(dir / kZArray);
    ArrayMeta m;
    try {
        if (doc.at("zarr_format").get<int>() != 2) {
            throw FeatureUnavailableError("only zarr format 2 arrays are supported ('" +
                                          dir.string() + "')");
        }
        m.shape = doc.at("shape").get<std::vector<Size>>();
        m.chunks = doc.at("chunks").get<std::vector<Size>>();
        m.dtype = doc.at("dtype");
        if (const auto it = doc.find("fill_value"); it != doc.end()) m.fill_value = *it;

        if (const auto it = doc.find("order"); it != doc.end() && it->get<std::string>() != "C") {
            throw FeatureUnavailableError("Fortran-ordered zarr arrays are not supported");
        }

        if (const auto it = doc.find("compressor"); it != doc.end() && !it->is_null()) {
            m.compressor = codec::parse_zarr_codec(it->at("id").get<std::string>());
            m.level = it->value("level", -1);
        }

        if (const auto it = doc.find("filters"); it != doc.end() && !it->is_null()) {
            for (const auto& f : *it) {
                const auto id = f.at("id").get<std::string>();
                if (id == "vlen-utf8") {
                    m.vlen_utf8 = true;
                } else if (id == "shuffle") {
                    m.shuffle = f.value("elementsize", Size{4});
                } else {
                    throw FeatureUnavailableError("unsupported zarr filter '" + id + "'");
                }
            }
        }

        if (const auto it = doc.find("dimension_separator"); it != doc.end()) {
            const auto sep = it->get<std::string>();
            if (sep != "." && sep != "/") {
                throw ReadError("invalid dimension_separator '" + sep + "'");
            }
            m.separator = sep.front();
        }
    } catch (const json::exception& e) {
        throw ReadError("malformed .zarray in '" + dir.string() + "': " + e.what());
    }

    if (m.chunks.size() != m.shape.size() ||
        std::find(m.chunks.begin(), m.chunks.end(), Size{0}) != m.chunks.end()) {
        throw ReadError("invalid chunk shape in '" + dir.string() + "'");
    }
    return m;
}

void ArrayMeta::store(const fs::path& dir) const {
    json doc;
    doc["zarr_format"] = 2;
    doc["shape"] = shape;
    doc["chunks"] = chunks;
    doc["dtype"] = dtype;
    doc["fill_value"] = fill_value;
    doc["order"] = "C";

    if (compressor == Compression::None) {
        doc["compressor"] = nullptr;
    } else {
        const int lvl = level >= 0 ? level
                      : compressor == Compression::Zstd ? config::kDefaultZstdLevel
                      : config::kDefaultGzipLevel;
        doc["compressor"] = json::object({{"id", codec::zarr_codec_id(compressor)}, {"level", lvl}});
    }

    json filters = json::array();
    if (vlen_utf8) filters.push_back(json::object({{"id", "vlen-utf8"}}));
    if (shuffle > 0) filters.push_back(json::object({{"id", "shuffle"}, {"elementsize", shuffle}}));
    doc["filters"] = filters.empty() ? json(nullptr) : filters;
    doc["dimension_separator"] = std::string(1, separator);

    write_json(dir / kZArray, doc);
}

} // namespace zarr

// =============================================================================
// ZarrGroupNode
// =============================================================================

ZarrGroupNode::ZarrGroupNode(fs::path root, std::string rel)
    : root_(std::move(root)), rel_(std::move(rel))
{}

std::string ZarrGroupNode::path() const {
    return "/" + rel_;
}

bool ZarrGroupNode::has_attr(const std::string& name) const {
    return node_has_attr(dir(), name);
}

std::optional<AttrValue> ZarrGroupNode::get_attr(const std::string& name) const {
    return node_get_attr(dir(), name);
}

void ZarrGroupNode::set_attr(const std::string& name, const AttrValue& value) {
    node_set_attr(dir(), name, value);
}

std::vector<std::string> ZarrGroupNode::attr_names() const {
    return node_attr_names(dir());
}

std::unique_ptr<GroupNode> ZarrGroupNode::create_group(const std::string& key) {
    const std::string rel = join_rel(rel_, key);
    const fs::path d = root_ / rel;
    create_node_dir(d);
    write_json(d / kZGroup, json::object({{"zarr_format", 2}}));
    return std::make_unique<ZarrGroupNode>(root_, rel);
}

std::unique_ptr<ArrayNode> ZarrGroupNode::create_array(
    const std::string& key, const DenseArray& data, const WriteOptions& options)
{
    const bool text = is_text(data.dtype());
    const Size width = text ? sizeof(char*) : dtype_size(data.dtype());

    zarr::ArrayMeta m = make_meta(data.shape(), width, options);
    m.dtype = format_type(data.dtype());
    m.fill_value = default_fill(data.dtype());
    m.vlen_utf8 = text;
    if (options.shuffle && !text && width > 1) m.shuffle = width;

    const std::string rel = join_rel(rel_, key);
    const fs::path d = root_ / rel;
    create_node_dir(d);
    m.store(d);
    if (text) {
        write_vlen(d, m, data.strings());
    } else {
        write_fixed(d, m, data.raw(), width);
    }
    return std::make_unique<ZarrArrayNode>(root_, rel);
}

std::unique_ptr<ArrayNode> ZarrGroupNode::create_records(
    const std::string& key, const RecordArray& data, const WriteOptions& options)
{
    CELIO_CHECK_ARG(data.num_fields() > 0, "record arrays need at least one field");

    // text fields become fixed-width UTF-32 sized to the longest value
    const Size n = data.size();
    json dtype = json::array();
    std::vector<Size> widths;
    std::vector<std::vector<std::u32string>> wide(data.num_fields());
    Size row = 0;
    for (Size f = 0; f < data.num_fields(); ++f) {
        const auto& field = data.fields()[f];
        std::string type;
        Size w = 0;
        if (is_text(field.dtype())) {
            Size chars = 1;
            for (const auto& s : field.strings()) {
                wide[f].push_back(utf8_to_utf32(s));
                chars = std::max(chars, wide[f].back().size());
            }
            type = "<U" + std::to_string(chars);
            w = 4 * chars;
        } else {
            type = format_type(field.dtype());
            w = dtype_size(field.dtype());
        }
        dtype.push_back(json::array({data.names()[f], type}));
        widths.push_back(w);
        row += w;
    }

    std::vector<Byte> rows(n * row, 0);
    Size offset = 0;
    for (Size f = 0; f < data.num_fields(); ++f) {
        const auto& field = data.fields()[f];
        for (Size i = 0; i < n; ++i) {
            Byte* cell = rows.data() + i * row + offset;
            if (is_text(field.dtype())) {
                encode_utf32(wide[f][i], cell, widths[f]);
            } else {
                std::memcpy(cell, field.raw() + i * widths[f], widths[f]);
            }
        }
        offset += widths[f];
    }

    zarr::ArrayMeta m = make_meta({n}, row, options);
    m.dtype = std::move(dtype);
    m.fill_value = nullptr;

    const std::string rel = join_rel(rel_, key);
    const fs::path d = root_ / rel;
    create_node_dir(d);
    m.store(d);
    write_fixed(d, m, rows.data(), row);
    return std::make_unique<ZarrArrayNode>(root_, rel);
}

void ZarrGroupNode::delete_child(const std::string& key) {
    const fs::path d = dir() / key;
    if (!fs::exists(d)) return;
    std::error_code ec;
    fs::remove_all(d, ec);
    if (ec) throw WriteError("cannot delete '" + d.string() + "': " + ec.message());
}

bool ZarrGroupNode::has_child(const std::string& key) const {
    const fs::path d = dir() / key;
    return is_zgroup(d) || is_zarray(d);
}

std::vector<std::string> ZarrGroupNode::child_names() const {
    std::vector<std::string> names;
    for (const auto& entry : fs::directory_iterator(dir())) {
        if (!entry.is_directory()) continue;
        if (is_zgroup(entry.path()) || is_zarray(entry.path())) {
            names.push_back(entry.path().filename().string());
        }
    }
    std::sort(names.begin(), names.end());
    return names;
}

std::unique_ptr<Node> ZarrGroupNode::open(const std::string& key) const {
    std::string rel;
    if (!key.empty() && key.front() == '/') {
        rel = key.substr(1);
    } else {
        rel = join_rel(rel_, key);
    }
    while (!rel.empty() && rel.back() == '/') rel.pop_back();

    const fs::path d = root_ / rel;
    if (is_zgroup(d)) return std::make_unique<ZarrGroupNode>(root_, rel);
    if (is_zarray(d)) return std::make_unique<ZarrArrayNode>(root_, rel);
    throw ReadError("no such node '" + key + "' in " + path());
}

// =============================================================================
// ZarrArrayNode
// =============================================================================

ZarrArrayNode::ZarrArrayNode(fs::path root, std::string rel)
    : root_(std::move(root)), rel_(std::move(rel)), meta_(zarr::ArrayMeta::load(root_ / rel_))
{}

std::string ZarrArrayNode::path() const {
    return "/" + rel_;
}

bool ZarrArrayNode::has_attr(const std::string& name) const {
    return node_has_attr(dir(), name);
}

std::optional<AttrValue> ZarrArrayNode::get_attr(const std::string& name) const {
    return node_get_attr(dir(), name);
}

void ZarrArrayNode::set_attr(const std::string& name, const AttrValue& value) {
    node_set_attr(dir(), name, value);
}

std::vector<std::string> ZarrArrayNode::attr_names() const {
    return node_attr_names(dir());
}

DType ZarrArrayNode::dtype() const {
    if (is_records()) {
        throw TypeError("'" + path() + "' holds records and has no element dtype");
    }
    return parse_type(meta_.dtype.get<std::string>()).dtype;
}

DenseArray ZarrArrayNode::read() const {
    if (is_records()) {
        throw TypeError("'" + path() + "' holds records; use read_records()");
    }
    const FieldType t = parse_type(meta_.dtype.get<std::string>());
    DenseArray out(t.dtype, meta_.shape);
    if (out.size() == 0) return out;

    const Size nitems = product(meta_.chunks);
    const Size w = t.width;
    for_each_chunk(meta_.shape, meta_.chunks, [&](const std::vector<Size>& cidx) {
        ChunkData chunk = load_chunk(dir(), meta_, t, cidx, nitems);
        for_each_run(meta_.shape, meta_.chunks, cidx, [&](Size c, Size a, Size run) {
            if (t.is_text()) {
                auto& strs = out.strings();
                for (Size k = 0; k < run; ++k) strs[a + k] = std::move(chunk.strings[c + k]);
            } else {
                std::memcpy(out.raw() + a * w, chunk.bytes.data() + c * w, run * w);
            }
        });
    });
    return out;
}

DenseArray ZarrArrayNode::read(const Indices& indices) const {
    if (is_full_selection(indices) || meta_.shape.empty()) return read();
    if (is_records()) {
        throw TypeError("'" + path() + "' holds records; use read_records()");
    }

    const FieldType t = parse_type(meta_.dtype.get<std::string>());
    const auto sel = resolve_indices(indices, meta_.shape);
    DenseArray out(t.dtype, selection_shape(sel));
    if (out.size() == 0) return out;

    // per axis: touched chunks, and (output position, offset in chunk) pairs
    struct AxisPlan {
        std::vector<Size> chunk_ids;
        std::vector<std::vector<std::pair<Size, Size>>> members;
    };
    const Size rank = sel.size();
    std::vector<AxisPlan> plans(rank);
    std::vector<Size> nchunks(rank);
    for (Size ax = 0; ax < rank; ++ax) {
        std::map<Size, std::vector<std::pair<Size, Size>>> by_chunk;
        const Size c = meta_.chunks[ax];
        for (Size i = 0; i < sel[ax].size(); ++i) {
            const Size p = sel[ax][i];
            by_chunk[p / c].emplace_back(i, p % c);
        }
        for (auto& [id, members] : by_chunk) {
            plans[ax].chunk_ids.push_back(id);
            plans[ax].members.push_back(std::move(members));
        }
        nchunks[ax] = plans[ax].chunk_ids.size();
    }

    const auto ostride = strides_of(out.shape());
    const auto cstride = strides_of(meta_.chunks);
    const Size nitems = product(meta_.chunks);
    const Size w = t.width;

    std::vector<Size> pick(rank, 0);
    std::vector<Size> cidx(rank);
    do {
        std::vector<Size> counts(rank);
        for (Size ax = 0; ax < rank; ++ax) {
            cidx[ax] = plans[ax].chunk_ids[pick[ax]];
            counts[ax] = plans[ax].members[pick[ax]].size();
        }
        const ChunkData chunk = load_chunk(dir(), meta_, t, cidx, nitems);

        std::vector<Size> m(rank, 0);
        do {
            Size o = 0;
            Size c = 0;
            for (Size ax = 0; ax < rank; ++ax) {
                const auto& [pos, off] = plans[ax].members[pick[ax]][m[ax]];
                o += pos * ostride[ax];
                c += off * cstride[ax];
            }
            if (t.is_text()) {
                out.strings()[o] = chunk.strings[c];
            } else {
                std::memcpy(out.raw() + o * w, chunk.bytes.data() + c * w, w);
            }
        } while (advance(m, counts));
    } while (advance(pick, nchunks));
    return out;
}

RecordArray ZarrArrayNode::read_records() const {
    if (!is_records()) {
        throw TypeError("'" + path() + "' is not a record array");
    }
    if (meta_.shape.size() != 1) {
        throw ReadError("record array '" + path() + "' must be one-dimensional");
    }

    std::vector<std::string> names;
    std::vector<FieldType> types;
    std::vector<Size> offsets;
    Size row = 0;
    try {
        for (const auto& f : meta_.dtype) {
            if (!f.is_array() || f.size() != 2) {
                throw FeatureUnavailableError("record fields with sub-array shapes are not supported");
            }
            FieldType t = parse_type(f[1].get<std::string>());
            if (t.kind == 'O') {
                throw FeatureUnavailableError("object fields in record arrays are not supported");
            }
            names.push_back(f[0].get<std::string>());
            offsets.push_back(row);
            row += t.width;
            types.push_back(t);
        }
    } catch (const json::exception& e) {
        throw ReadError("malformed record dtype in '" + path() + "': " + e.what());
    }

    const Size n = meta_.shape[0];
    std::vector<Byte> rows(n * row, 0);
    FieldType raw;
    raw.kind = 'V';
    raw.width = row;
    const Size nitems = product(meta_.chunks);
    for_each_chunk(meta_.shape, meta_.chunks, [&](const std::vector<Size>& cidx) {
        const ChunkData chunk = load_chunk(dir(), meta_, raw, cidx, nitems);
        for_each_run(meta_.shape, meta_.chunks, cidx, [&](Size c, Size a, Size run) {
            std::memcpy(rows.data() + a * row, chunk.bytes.data() + c * row, run * row);
        });
    });

    RecordArray out;
    for (Size f = 0; f < types.size(); ++f) {
        const FieldType& t = types[f];
        DenseArray column(t.dtype, {n});
        if (t.is_text()) {
            auto& strs = column.strings();
            for (Size i = 0; i < n; ++i) strs[i] = decode_fixed(t, rows.data() + i * row + offsets[f]);
        } else {
            for (Size i = 0; i < n; ++i) {
                Byte* dst = column.raw() + i * t.width;
                std::memcpy(dst, rows.data() + i * row + offsets[f], t.width);
                if (t.order == '>') std::reverse(dst, dst + t.width);
            }
        }
        out.add_field(names[f], std::move(column));
    }
    return out;
}

// =============================================================================
// ZarrStore
// =============================================================================

ZarrStore ZarrStore::create(const fs::path& dir) {
    std::error_code ec;
    fs::remove_all(dir, ec);
    if (ec) throw WriteError("cannot replace '" + dir.string() + "': " + ec.message());
    fs::create_directories(dir, ec);
    if (ec) throw WriteError("cannot create '" + dir.string() + "': " + ec.message());
    write_json(dir / kZGroup, json::object({{"zarr_format", 2}}));
    return ZarrStore(dir);
}

ZarrStore ZarrStore::open(const fs::path& dir) {
    if (!is_zgroup(dir)) {
        throw FileNotFoundError("no zarr group at '" + dir.string() + "'");
    }
    return ZarrStore(dir);
}

std::unique_ptr<GroupNode> ZarrStore::root() const {
    return std::make_unique<ZarrGroupNode>(dir_, "");
}

} // namespace celio
