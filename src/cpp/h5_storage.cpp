#include "celio/io/h5_storage.hpp"
#include "celio/io/chunking.hpp"

#include <algorithm>
#include <cstring>
#include <filesystem>
#include <utility>

namespace celio {

namespace {

// =============================================================================
// Strings
// =============================================================================

std::string trim_fixed(const char* p, size_t size, H5T_str_t pad) {
    std::string s(p, size);
    const auto nul = s.find('\0');
    if (nul != std::string::npos) s.resize(nul);
    if (pad == H5T_STR_SPACEPAD) {
        while (!s.empty() && s.back() == ' ') s.pop_back();
    }
    return s;
}

/// Memory type used to read a stored string type.
h5::Datatype string_mem_type(const h5::Datatype& file_type) {
    if (file_type.is_variable_str()) {
        h5::Datatype t = h5::Datatype::string_vlen();
        h5::detail::check_h5(H5Tset_cset(t.id(), H5Tget_cset(file_type.id())), "H5Tset_cset");
        return t;
    }
    return h5::Datatype::copy_of(file_type.id());
}

std::vector<std::string> read_strings(const std::vector<char*>& ptrs) {
    std::vector<std::string> out;
    out.reserve(ptrs.size());
    for (const char* p : ptrs) out.emplace_back(p ? p : "");
    return out;
}

// =============================================================================
// Attributes
// =============================================================================

void write_attr(h5::AttrHost& host, const std::string& name, const AttrValue& value) {
    std::visit([&](const auto& v) {
        using V = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<V, bool>) {
            auto type = h5::Datatype::bool_enum();
            auto attr = host.recreate_attr(name, type, h5::Dataspace::scalar());
            const std::int8_t b = v ? 1 : 0;
            attr.write(type, &b);
        } else if constexpr (std::is_same_v<V, std::int64_t>) {
            auto type = h5::Datatype::copy_of(H5T_NATIVE_INT64);
            host.recreate_attr(name, type, h5::Dataspace::scalar()).write(type, &v);
        } else if constexpr (std::is_same_v<V, double>) {
            auto type = h5::Datatype::copy_of(H5T_NATIVE_DOUBLE);
            host.recreate_attr(name, type, h5::Dataspace::scalar()).write(type, &v);
        } else if constexpr (std::is_same_v<V, std::string>) {
            auto type = h5::Datatype::string_vlen();
            const char* p = v.c_str();
            host.recreate_attr(name, type, h5::Dataspace::scalar()).write(type, &p);
        } else if constexpr (std::is_same_v<V, std::vector<std::string>>) {
            auto type = h5::Datatype::string_vlen();
            std::vector<const char*> ptrs;
            ptrs.reserve(v.size());
            for (const auto& s : v) ptrs.push_back(s.c_str());
            auto attr = host.recreate_attr(name, type, h5::Dataspace(std::vector<hsize_t>{v.size()}));
            if (!ptrs.empty()) attr.write(type, ptrs.data());
        } else if constexpr (std::is_same_v<V, std::vector<std::int64_t>>) {
            auto type = h5::Datatype::copy_of(H5T_NATIVE_INT64);
            auto attr = host.recreate_attr(name, type, h5::Dataspace(std::vector<hsize_t>{v.size()}));
            if (!v.empty()) attr.write(type, v.data());
        } else {
            auto type = h5::Datatype::copy_of(H5T_NATIVE_DOUBLE);
            auto attr = host.recreate_attr(name, type, h5::Dataspace(std::vector<hsize_t>{v.size()}));
            if (!v.empty()) attr.write(type, v.data());
        }
    }, value);
}

std::optional<AttrValue> read_attr(const h5::AttrHost& host, const std::string& name) {
    if (!host.has_attr(name)) return std::nullopt;

    h5::Attribute attr = host.open_attr(name);
    h5::Datatype type = attr.get_type();
    h5::Dataspace space = attr.get_space();
    const bool scalar = space.is_scalar();
    const auto n = static_cast<size_t>(std::max<hssize_t>(space.get_num_elements(), 0));

    switch (type.get_class()) {
        case H5T_ENUM: {
            if (!type.is_bool_enum()) break;
            auto mem = h5::Datatype::bool_enum();
            std::vector<std::int8_t> buf(std::max<size_t>(n, 1));
            if (n > 0) attr.read(mem, buf.data());
            if (scalar) return AttrValue{buf[0] != 0};
            return AttrValue{std::vector<std::int64_t>(buf.begin(), buf.begin() + static_cast<std::ptrdiff_t>(n))};
        }
        case H5T_INTEGER: {
            auto mem = h5::Datatype::copy_of(H5T_NATIVE_INT64);
            std::vector<std::int64_t> buf(n);
            if (n > 0) attr.read(mem, buf.data());
            if (scalar) return AttrValue{buf.at(0)};
            return AttrValue{std::move(buf)};
        }
        case H5T_FLOAT: {
            auto mem = h5::Datatype::copy_of(H5T_NATIVE_DOUBLE);
            std::vector<double> buf(n);
            if (n > 0) attr.read(mem, buf.data());
            if (scalar) return AttrValue{buf.at(0)};
            return AttrValue{std::move(buf)};
        }
        case H5T_STRING: {
            std::vector<std::string> values;
            auto mem = string_mem_type(type);
            if (type.is_variable_str()) {
                std::vector<char*> ptrs(n, nullptr);
                if (n > 0) {
                    attr.read(mem, ptrs.data());
                    values = read_strings(ptrs);
                    h5::Dataset::reclaim(mem, space, ptrs.data());
                }
            } else {
                const size_t width = type.get_size();
                std::vector<char> buf(n * width);
                if (n > 0) attr.read(mem, buf.data());
                for (size_t i = 0; i < n; ++i) {
                    values.push_back(trim_fixed(buf.data() + i * width, width, type.get_strpad()));
                }
            }
            if (scalar) return AttrValue{values.at(0)};
            return AttrValue{std::move(values)};
        }
        case H5T_REFERENCE: {
            // object references (legacy categorical links) resolve to paths
            auto mem = h5::Datatype::copy_of(H5T_STD_REF_OBJ);
            std::vector<hobj_ref_t> refs(n);
            if (n > 0) attr.read(mem, refs.data());
            std::vector<std::string> paths;
            paths.reserve(n);
            for (const auto& r : refs) paths.push_back(host.dereference_name(r));
            if (scalar) return AttrValue{paths.at(0)};
            return AttrValue{std::move(paths)};
        }
        default:
            break;
    }
    throw TypeError("unsupported HDF5 attribute type for '" + name + "'");
}

// =============================================================================
// Dataset creation
// =============================================================================

h5::DatasetCreateProps make_create_props(const std::vector<Size>& shape, Size itemsize,
                                         const WriteOptions& options,
                                         std::vector<hsize_t>& maxdims) {
    h5::DatasetCreateProps props;
    maxdims.assign(shape.begin(), shape.end());

    if (options.compression == Compression::Zstd) {
        throw FeatureUnavailableError("zstd compression is not available for hdf5 datasets");
    }

    const bool needs_chunks = options.resizable || options.is_compressed() ||
                              options.shuffle || !options.chunks.empty();
    if (!needs_chunks) return props;

    if (shape.empty()) {
        throw WriteError("scalar datasets cannot be chunked, compressed or resized");
    }

    std::vector<Size> chunks = options.chunks;
    if (chunks.empty()) {
        chunks = guess_chunks(shape, itemsize);
    } else if (chunks.size() != shape.size()) {
        throw ValueError("chunk shape rank " + std::to_string(chunks.size()) +
                         " does not match dataset rank " + std::to_string(shape.size()));
    }

    for (Size i = 0; i < shape.size(); ++i) {
        // fixed axes cannot have chunks longer than the axis
        const bool unlimited = options.resizable || shape[i] == 0;
        if (unlimited) {
            maxdims[i] = H5S_UNLIMITED;
        } else {
            chunks[i] = std::min(chunks[i], shape[i]);
        }
        chunks[i] = std::max<Size>(chunks[i], 1);
    }
    props.chunked(std::vector<hsize_t>(chunks.begin(), chunks.end()));

    if (options.shuffle) props.shuffle();
    if (options.compression == Compression::Gzip) {
        const int level = options.level < 0 ? config::kDefaultGzipLevel : options.level;
        props.deflate(static_cast<unsigned>(level));
    }
    return props;
}

h5::Dataspace make_space(const std::vector<Size>& shape, const std::vector<hsize_t>& maxdims) {
    if (shape.empty()) return h5::Dataspace::scalar();
    return h5::Dataspace(std::vector<hsize_t>(shape.begin(), shape.end()), maxdims);
}

// Hyperslab plan for one axis: contiguous runs of sorted unique positions,
// or a single strided run for range selectors.
struct AxisRuns {
    std::vector<hsize_t> starts;
    std::vector<hsize_t> counts;
    hsize_t stride = 1;
    std::vector<Size> unique;   // empty for range selectors
    Size extent = 0;            // number of selected positions read
};

AxisRuns plan_axis(const AxisSelection& sel) {
    AxisRuns runs;
    if (sel.is_range) {
        runs.starts = {sel.start};
        runs.counts = {sel.count};
        runs.stride = std::max<Size>(sel.step, 1);
        runs.extent = sel.count;
        return runs;
    }
    runs.unique = sel.positions;
    std::sort(runs.unique.begin(), runs.unique.end());
    runs.unique.erase(std::unique(runs.unique.begin(), runs.unique.end()), runs.unique.end());
    for (Size i = 0; i < runs.unique.size(); ++i) {
        if (i > 0 && runs.unique[i] == runs.unique[i - 1] + 1) {
            ++runs.counts.back();
        } else {
            runs.starts.push_back(runs.unique[i]);
            runs.counts.push_back(1);
        }
    }
    runs.extent = runs.unique.size();
    return runs;
}

} // namespace

// =============================================================================
// H5GroupNode
// =============================================================================

H5GroupNode::H5GroupNode(std::shared_ptr<h5::File> file, h5::Group group)
    : file_(std::move(file)), group_(std::move(group))
{}

std::string H5GroupNode::path() const {
    return group_.get_name();
}

bool H5GroupNode::has_attr(const std::string& name) const {
    return group_.has_attr(name);
}

std::optional<AttrValue> H5GroupNode::get_attr(const std::string& name) const {
    return read_attr(group_, name);
}

void H5GroupNode::set_attr(const std::string& name, const AttrValue& value) {
    write_attr(group_, name, value);
}

std::vector<std::string> H5GroupNode::attr_names() const {
    return group_.attr_names();
}

std::unique_ptr<GroupNode> H5GroupNode::create_group(const std::string& key) {
    return std::make_unique<H5GroupNode>(file_, h5::Group::create(group_.id(), key));
}

std::unique_ptr<ArrayNode> H5GroupNode::create_array(
    const std::string& key, const DenseArray& data, const WriteOptions& options)
{
    const bool text = is_text(data.dtype());
    std::vector<hsize_t> maxdims;
    auto props = make_create_props(data.shape(), text ? sizeof(char*) : dtype_size(data.dtype()),
                                   options, maxdims);
    auto space = make_space(data.shape(), maxdims);
    auto type = h5::Datatype::native(data.dtype());
    auto dataset = h5::Dataset::create(group_.id(), key, type, space, props);

    if (data.size() > 0) {
        if (text) {
            std::vector<const char*> ptrs;
            ptrs.reserve(data.size());
            for (const auto& s : data.strings()) ptrs.push_back(s.c_str());
            dataset.write(type, ptrs.data());
        } else {
            dataset.write(type, data.raw());
        }
    }
    return std::make_unique<H5ArrayNode>(file_, std::move(dataset));
}

std::unique_ptr<ArrayNode> H5GroupNode::create_records(
    const std::string& key, const RecordArray& data, const WriteOptions& options)
{
    // packed compound layout; text fields become variable-length strings
    std::vector<size_t> offsets;
    size_t row_size = 0;
    for (const auto& field : data.fields()) {
        offsets.push_back(row_size);
        row_size += is_text(field.dtype()) ? sizeof(char*) : dtype_size(field.dtype());
    }
    CELIO_CHECK_ARG(row_size > 0, "record arrays need at least one field");

    auto type = h5::Datatype::compound(row_size);
    for (Size f = 0; f < data.num_fields(); ++f) {
        type.insert(data.names()[f], offsets[f], h5::Datatype::native(data.fields()[f].dtype()));
    }

    const Size n = data.size();
    std::vector<Byte> buffer(n * row_size);
    for (Size f = 0; f < data.num_fields(); ++f) {
        const auto& field = data.fields()[f];
        if (is_text(field.dtype())) {
            const auto& strs = field.strings();
            for (Size i = 0; i < n; ++i) {
                const char* p = strs[i].c_str();
                std::memcpy(buffer.data() + i * row_size + offsets[f], &p, sizeof(char*));
            }
        } else {
            const Size w = dtype_size(field.dtype());
            for (Size i = 0; i < n; ++i) {
                std::memcpy(buffer.data() + i * row_size + offsets[f], field.raw() + i * w, w);
            }
        }
    }

    std::vector<hsize_t> maxdims;
    auto props = make_create_props({n}, row_size, options, maxdims);
    auto space = make_space({n}, maxdims);
    auto dataset = h5::Dataset::create(group_.id(), key, type, space, props);
    if (n > 0) dataset.write(type, buffer.data());
    return std::make_unique<H5ArrayNode>(file_, std::move(dataset));
}

void H5GroupNode::delete_child(const std::string& key) {
    if (group_.exists(key)) group_.unlink(key);
}

bool H5GroupNode::has_child(const std::string& key) const {
    return group_.exists(key);
}

std::vector<std::string> H5GroupNode::child_names() const {
    return group_.list_objects();
}

std::unique_ptr<Node> H5GroupNode::open(const std::string& key) const {
    const bool absolute = !key.empty() && key.front() == '/';
    if (absolute && key == "/") {
        return std::make_unique<H5GroupNode>(file_, file_->root());
    }

    const h5::Group base = absolute ? file_->root() : h5::Group(group_.id(), ".");
    const std::string rel = absolute ? key.substr(1) : key;

    switch (base.get_object_type(rel)) {
        case h5::ObjectType::Group:
            return std::make_unique<H5GroupNode>(file_, h5::Group(base.id(), rel));
        case h5::ObjectType::Dataset:
            return std::make_unique<H5ArrayNode>(file_, h5::Dataset(base.id(), rel));
        case h5::ObjectType::Unknown:
            break;
    }
    throw ReadError("no such node '" + key + "' in " + path());
}

// =============================================================================
// H5ArrayNode
// =============================================================================

H5ArrayNode::H5ArrayNode(std::shared_ptr<h5::File> file, h5::Dataset dataset)
    : file_(std::move(file)), dataset_(std::move(dataset))
{}

std::string H5ArrayNode::path() const {
    return dataset_.get_name();
}

bool H5ArrayNode::has_attr(const std::string& name) const {
    return dataset_.has_attr(name);
}

std::optional<AttrValue> H5ArrayNode::get_attr(const std::string& name) const {
    return read_attr(dataset_, name);
}

void H5ArrayNode::set_attr(const std::string& name, const AttrValue& value) {
    write_attr(dataset_, name, value);
}

std::vector<std::string> H5ArrayNode::attr_names() const {
    return dataset_.attr_names();
}

std::vector<Size> H5ArrayNode::shape() const {
    const auto dims = dataset_.get_space().get_dims();
    return {dims.begin(), dims.end()};
}

DType H5ArrayNode::dtype() const {
    return dataset_.get_type().to_dtype();
}

bool H5ArrayNode::is_records() const {
    return dataset_.get_type().get_class() == H5T_COMPOUND;
}

DenseArray H5ArrayNode::read_space(const h5::Dataspace& mem_space,
                                   const h5::Dataspace& file_space,
                                   std::vector<Size> shape) const
{
    const auto file_type = dataset_.get_type();
    const DType dt = file_type.to_dtype();
    DenseArray out(dt, std::move(shape));
    const Size n = out.size();
    if (n == 0) return out;

    if (file_type.get_class() == H5T_STRING) {
        auto mem = string_mem_type(file_type);
        auto& strs = out.strings();
        if (file_type.is_variable_str()) {
            std::vector<char*> ptrs(n, nullptr);
            dataset_.read(mem, mem_space, file_space, ptrs.data());
            strs = read_strings(ptrs);
            h5::Dataset::reclaim(mem, mem_space, ptrs.data());
        } else {
            const size_t width = file_type.get_size();
            std::vector<char> buf(n * width);
            dataset_.read(mem, mem_space, file_space, buf.data());
            for (Size i = 0; i < n; ++i) {
                strs[i] = trim_fixed(buf.data() + i * width, width, file_type.get_strpad());
            }
        }
        return out;
    }

    dataset_.read(h5::Datatype::native(dt), mem_space, file_space, out.raw());
    return out;
}

DenseArray H5ArrayNode::read() const {
    if (is_records()) {
        throw TypeError("'" + path() + "' holds records; use read_records()");
    }
    auto space = dataset_.get_space();
    auto mem_space = space.is_scalar() ? h5::Dataspace::scalar() : dataset_.get_space();
    return read_space(mem_space, space, shape());
}

DenseArray H5ArrayNode::read(const Indices& indices) const {
    if (is_full_selection(indices)) return read();

    const auto dims = shape();
    const auto sel = resolve_indices(indices, dims);
    if (selection_volume(sel) == 0) {
        return DenseArray(dtype(), selection_shape(sel));
    }

    std::vector<AxisRuns> plans;
    plans.reserve(sel.size());
    for (const auto& s : sel) plans.push_back(plan_axis(s));

    // union of hyperslabs over the cartesian product of per-axis runs
    auto file_space = dataset_.get_space();
    file_space.select_none();
    const Size rank = plans.size();
    std::vector<Size> counter(rank, 0);
    std::vector<hsize_t> start(rank), count(rank), stride(rank);
    bool done = false;
    while (!done) {
        for (Size ax = 0; ax < rank; ++ax) {
            start[ax] = plans[ax].starts[counter[ax]];
            count[ax] = plans[ax].counts[counter[ax]];
            stride[ax] = plans[ax].stride;
        }
        file_space.select_hyperslab(start, count, stride, H5S_SELECT_OR);

        done = true;
        for (Size ax = rank; ax-- > 0;) {
            if (++counter[ax] < plans[ax].starts.size()) {
                done = false;
                break;
            }
            counter[ax] = 0;
        }
    }

    std::vector<Size> block_shape;
    std::vector<hsize_t> mem_dims;
    for (const auto& p : plans) {
        block_shape.push_back(p.extent);
        mem_dims.push_back(p.extent);
    }
    h5::Dataspace mem_space(mem_dims);
    DenseArray block = read_space(mem_space, file_space, block_shape);

    // hyperslabs come back sorted and deduplicated; restore request order
    // on axes whose request was not already strictly increasing
    bool reorder = false;
    std::vector<AxisSelection> remap(rank);
    for (Size ax = 0; ax < rank; ++ax) {
        if (sel[ax].is_monotone()) {
            remap[ax] = AxisSelection{true, 0, plans[ax].extent, 1, {}};
            continue;
        }
        reorder = true;
        remap[ax].is_range = false;
        const auto& uniq = plans[ax].unique;
        for (Size pos : sel[ax].positions) {
            const auto it = std::lower_bound(uniq.begin(), uniq.end(), pos);
            remap[ax].positions.push_back(static_cast<Size>(it - uniq.begin()));
        }
    }
    return reorder ? block.take(remap) : block;
}

RecordArray H5ArrayNode::read_records() const {
    const auto file_type = dataset_.get_type();
    if (file_type.get_class() != H5T_COMPOUND) {
        throw TypeError("'" + path() + "' is not a record array");
    }

    struct Member {
        std::string name;
        DType dtype;
        bool vlen = false;
        size_t width = 0;
        size_t offset = 0;
        H5T_str_t pad = H5T_STR_NULLTERM;
    };

    const int nmembers = file_type.get_nmembers();
    std::vector<Member> members;
    size_t row_size = 0;
    std::vector<h5::Datatype> mem_types;
    for (int i = 0; i < nmembers; ++i) {
        const auto idx = static_cast<unsigned>(i);
        auto mt = file_type.member_type(idx);
        Member m;
        m.name = file_type.member_name(idx);
        m.dtype = mt.to_dtype();
        m.offset = row_size;
        if (mt.get_class() == H5T_STRING) {
            m.vlen = mt.is_variable_str();
            m.pad = mt.get_strpad();
            mem_types.push_back(string_mem_type(mt));
            m.width = m.vlen ? sizeof(char*) : mt.get_size();
        } else {
            mem_types.push_back(h5::Datatype::native(m.dtype));
            m.width = dtype_size(m.dtype);
        }
        row_size += m.width;
        members.push_back(std::move(m));
    }

    auto mem_type = h5::Datatype::compound(std::max<size_t>(row_size, 1));
    for (Size i = 0; i < members.size(); ++i) {
        mem_type.insert(members[i].name, members[i].offset, mem_types[i]);
    }

    auto space = dataset_.get_space();
    const auto n = static_cast<Size>(std::max<hssize_t>(space.get_num_elements(), 0));
    std::vector<Byte> buffer(n * row_size);
    if (n > 0) dataset_.read(mem_type, buffer.data());

    RecordArray out;
    bool has_vlen = false;
    for (const auto& m : members) {
        DenseArray column(m.dtype, {n});
        if (is_text(m.dtype)) {
            auto& strs = column.strings();
            for (Size i = 0; i < n; ++i) {
                const Byte* cell = buffer.data() + i * row_size + m.offset;
                if (m.vlen) {
                    char* p = nullptr;
                    std::memcpy(&p, cell, sizeof(char*));
                    strs[i] = p ? p : "";
                } else {
                    strs[i] = trim_fixed(reinterpret_cast<const char*>(cell), m.width, m.pad);
                }
            }
            has_vlen = has_vlen || m.vlen;
        } else {
            for (Size i = 0; i < n; ++i) {
                std::memcpy(column.raw() + i * m.width,
                            buffer.data() + i * row_size + m.offset, m.width);
            }
        }
        out.add_field(m.name, std::move(column));
    }

    if (has_vlen && n > 0) h5::Dataset::reclaim(mem_type, space, buffer.data());
    return out;
}

// =============================================================================
// H5Store
// =============================================================================

H5Store H5Store::create(const std::string& path) {
    return H5Store(std::make_shared<h5::File>(path, h5::File::Mode::Truncate));
}

H5Store H5Store::open(const std::string& path, bool writable) {
    if (!std::filesystem::exists(path)) throw FileNotFoundError(path);
    return H5Store(std::make_shared<h5::File>(
        path, writable ? h5::File::Mode::ReadWrite : h5::File::Mode::ReadOnly));
}

std::unique_ptr<GroupNode> H5Store::root() const {
    return std::make_unique<H5GroupNode>(file_, file_->root());
}

void H5Store::flush() {
    file_->flush();
}

} // namespace celio
