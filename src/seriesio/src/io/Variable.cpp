#include "io/Variable.hpp"
#include "Errors.hpp"
#include "Log.hpp"
#include "io/ArrayFile.hpp"
#include "io/CharMatrix.hpp"

#include <algorithm>
#include <span>
#include <unordered_map>

namespace seriesio::io
{

using series::cells_of;

namespace
{

// Row-major strides (in elements) of `shape`.
std::vector<std::size_t> strides_of(const std::vector<std::size_t>& shape)
{
    std::vector<std::size_t> s(shape.size(), 1);
    for (std::size_t k = shape.size(); k-- > 1;)
        s[k - 1] = s[k] * shape[k];
    return s;
}

// Multi-index of the flat position `flat` within `shape` (row-major).
std::vector<std::size_t> unravel(std::size_t flat, const std::vector<std::size_t>& shape)
{
    std::vector<std::size_t> idx(shape.size(), 0);
    for (std::size_t k = shape.size(); k-- > 0;)
    {
        idx[k] = flat % shape[k];
        flat /= shape[k];
    }
    return idx;
}

std::string join_shape(const std::vector<std::size_t>& shape)
{
    std::string s = "(";
    for (std::size_t i = 0; i < shape.size(); ++i)
        s += (i ? ", " : "") + std::to_string(shape[i]);
    return s + ")";
}

// Labels of the Flat rows contributed by one device.
std::vector<std::string> flat_labels(const std::string& device,
                                     const std::vector<std::size_t>& shape)
{
    if (shape.empty())
        return {device};
    std::vector<std::string> out;
    const std::size_t n = cells_of(shape);
    out.reserve(n);
    for (std::size_t c = 0; c < n; ++c)
    {
        std::string label = device;
        for (std::size_t i : unravel(c, shape))
            label += "_" + std::to_string(i);
        out.push_back(std::move(label));
    }
    return out;
}

} // namespace

const char* to_string(Variable::Kind kind) noexcept
{
    switch (kind)
    {
    case Variable::Kind::Deep:
        return "deep";
    case Variable::Kind::Agg:
        return "agg";
    case Variable::Kind::Flat:
        return "flat";
    }
    return "?";
}

Variable::Variable(std::string name, Kind kind, bool isolate, NameMapping names)
    : name_(std::move(name)), kind_(kind), isolate_(isolate), names_(std::move(names))
{
}

/// \cond DOXYGEN_EXCLUDE

namespace
{

// Values per time point stored for one entry.
std::size_t entry_cells(Variable::Kind kind, const Variable::Entry& e)
{
    return kind == Variable::Kind::Agg ? 1 : cells_of(e.handle->shape());
}

std::span<const double> entry_data(const Variable::Entry& e)
{
    if (e.array)
        return e.array->values;
    return e.handle->series();
}

std::size_t entry_timepoints(Variable::Kind kind, const Variable::Entry& e)
{
    const std::size_t cells = entry_cells(kind, e);
    return cells ? entry_data(e).size() / cells : e.handle->timepoints();
}

} // namespace

/// \endcond

void Variable::log(series::ISeries& handle, std::optional<series::LoggedArray> array)
{
    const std::string& device = handle.device_name();
    if (array && !array->aggregated() && array->values.empty())
        array.reset(); // plain "unmodified" marker: write the handle's own series
    Entry e{&handle, std::move(array)};
    if (kind_ == Kind::Agg && !e.array && handle.ndim() != 0)
        throw Error(ErrorKind::InvalidArgument,
                    "Variable `" + name_ + "` stores aggregated values, but device `" + device +
                        "` supplied no aggregated array for its " +
                        std::to_string(handle.ndim()) + "-dimensional sequence.");
    const std::size_t cells = entry_cells(kind_, e);
    const std::size_t n = entry_data(e).size();
    if (cells && n % cells != 0)
        throw Error(ErrorKind::InvalidArgument,
                    "The array logged for device `" + device + "` in variable `" + name_ +
                        "` holds " + std::to_string(n) + " values, which is not a multiple of " +
                        std::to_string(cells) + " values per time point.");

    if (!entries_.count(device))
        order_.push_back(device);
    entries_[device] = std::move(e);
}

std::size_t Variable::max_rank() const
{
    std::size_t rank = 0;
    for (const auto& dev : order_)
        rank = std::max(rank, entries_.at(dev).handle->ndim());
    return rank;
}

std::vector<std::string> Variable::devicenames() const
{
    return order_;
}

const Variable::Entry& Variable::entry(const std::string& device) const
{
    if (const Entry* e = find(device))
        return *e;
    throw Error(ErrorKind::NotRegistered, "The variable `" + name_ +
                                              "` does not handle time series data under the "
                                              "(sub)device name `" +
                                              device + "`.");
}

const Variable::Entry* Variable::find(const std::string& device) const noexcept
{
    auto it = entries_.find(device);
    return it == entries_.end() ? nullptr : &it->second;
}

std::string Variable::prefix() const
{
    return isolate_ ? std::string() : name_ + "_";
}

std::vector<std::string> Variable::subdevicenames() const
{
    if (kind_ != Kind::Flat)
        return order_;
    std::vector<std::string> out;
    for (const auto& dev : order_)
    {
        auto labels = flat_labels(dev, entries_.at(dev).handle->shape());
        out.insert(out.end(), labels.begin(), labels.end());
    }
    return out;
}

std::vector<std::string> Variable::dimensions() const
{
    const std::string p = prefix();
    std::vector<std::string> dims{p + names_.dims.subdevices, names_.dims.timepoints};
    if (kind_ == Kind::Deep)
    {
        for (std::size_t k = 0; k < max_rank(); ++k)
            dims.push_back(p + "axis" + std::to_string(k + 3));
    }
    return dims;
}

std::vector<std::size_t> Variable::shape() const
{
    std::size_t ntime = 0;
    for (const auto& dev : order_)
        ntime = std::max(ntime, entry_timepoints(kind_, entries_.at(dev)));

    if (kind_ == Kind::Flat)
    {
        std::size_t rows = 0;
        for (const auto& dev : order_)
            rows += cells_of(entries_.at(dev).handle->shape());
        return {rows, ntime};
    }

    std::vector<std::size_t> shape{order_.size(), ntime};
    if (kind_ == Kind::Deep)
    {
        // axes a device lacks count with extent 1
        std::vector<std::size_t> maxext(max_rank(), 1);
        for (std::size_t k = 0; k < maxext.size(); ++k)
        {
            std::size_t m = 0;
            for (const auto& dev : order_)
            {
                const auto& ext = entries_.at(dev).handle->shape();
                m = std::max(m, k < ext.size() ? ext[k] : std::size_t(1));
            }
            maxext[k] = m;
        }
        shape.insert(shape.end(), maxext.begin(), maxext.end());
    }
    return shape;
}

std::vector<double> Variable::array() const
{
    const auto s = shape();
    std::vector<double> out(cells_of(s), names_.fill_value);
    const std::size_t ntime = s[1];

    if (kind_ == Kind::Flat)
    {
        std::size_t row = 0;
        for (const auto& dev : order_)
        {
            const Entry& e = entries_.at(dev);
            const auto data = entry_data(e);
            const std::size_t cells = cells_of(e.handle->shape());
            const std::size_t nt = entry_timepoints(kind_, e);
            for (std::size_t c = 0; c < cells; ++c, ++row)
                for (std::size_t t = 0; t < nt; ++t)
                    out[row * ntime + t] = data[t * cells + c];
        }
        return out;
    }

    const auto stride = strides_of(s);
    for (std::size_t i = 0; i < order_.size(); ++i)
    {
        const Entry& e = entries_.at(order_[i]);
        const auto data = entry_data(e);
        const std::vector<std::size_t> ext =
            kind_ == Kind::Agg ? std::vector<std::size_t>{} : e.handle->shape();
        const std::size_t cells = cells_of(ext);
        const std::size_t nt = entry_timepoints(kind_, e);
        for (std::size_t c = 0; c < cells; ++c)
        {
            const auto idx = unravel(c, ext);
            std::size_t off = i * stride[0];
            for (std::size_t k = 0; k < idx.size(); ++k)
                off += idx[k] * stride[k + 2];
            for (std::size_t t = 0; t < nt; ++t)
                out[off + t * stride[1]] = data[t * cells + c];
        }
    }
    return out;
}

void Variable::insert_subdevicenames(ArrayFile& file) const
{
    const std::string p = prefix();
    const CharMatrix m = str2chars(subdevicenames());
    const std::string dim_rows = p + names_.dims.subdevices;
    const std::string dim_chars = p + names_.dims.characters;
    const std::string var = p + names_.vars.subdevices;
    file.create_dimension(dim_rows, m.rows);
    file.create_dimension(dim_chars, m.width);
    file.create_variable(var, DType::Char, {dim_rows, dim_chars}, names_.fill_value);
    file.write_chars(var, m.data);
}

std::vector<std::string> Variable::query_subdevicenames(const ArrayFile& file) const
{
    const std::string candidates[2] = {name_ + "_" + names_.vars.subdevices,
                                       names_.vars.subdevices};
    for (const auto& var : candidates)
    {
        if (!file.has_variable(var))
            continue;
        const auto shape = file.variable_shape(var);
        if (shape.size() != 2)
            throw Error(ErrorKind::InvalidArgument,
                        "The coordinate variable `" + var + "` of file `" + file.path() +
                            "` has shape " + join_shape(shape) +
                            " but a 2-dimensional character matrix is required.");
        return chars2str(file.read_chars(var), shape[0], shape[1]);
    }
    throw Error(ErrorKind::MissingCoordinate,
                "File `" + file.path() + "` does neither contain a variable named `" +
                    candidates[0] + "` nor `" + candidates[1] +
                    "` for defining the coordinate locations of variable `" + name_ + "`.");
}

Subdevice2Index Variable::query_subdevice2index(const ArrayFile& file) const
{
    const auto labels = query_subdevicenames(file);
    std::unordered_map<std::string, std::size_t> count;
    for (const auto& l : labels)
        ++count[l];
    for (const auto& l : labels)
        if (count[l] > 1)
            throw Error(ErrorKind::DuplicateSubdevice,
                        "The file `" + file.path() +
                            "` contains duplicate (sub)device names for variable `" + name_ +
                            "` (the first found duplicate is `" + l + "`).");

    std::unordered_map<std::string, std::size_t> rows;
    rows.reserve(labels.size());
    for (std::size_t i = 0; i < labels.size(); ++i)
        rows.emplace(labels[i], i);
    return Subdevice2Index(std::move(rows), name_, file.path());
}

void Variable::read(const ArrayFile& file, const time::Timegrid& window)
{
    if (kind_ == Kind::Agg)
        throw Error(ErrorKind::NotInvertible,
                    "The process of aggregating values (of sequence `" + name_ +
                        "` and other sequences as well) is not invertible.");

    const auto fshape = file.variable_shape(name_);
    const auto data = file.read_doubles(name_);
    const Subdevice2Index index = query_subdevice2index(file);
    if (fshape.size() < 2)
        throw Error(ErrorKind::InvalidArgument, "Variable `" + name_ + "` of file `" +
                                                    file.path() + "` has shape " +
                                                    join_shape(fshape) + ".");
    const std::size_t ntime = fshape[1];

    if (kind_ == Kind::Flat)
    {
        for (const auto& dev : order_)
        {
            series::ISeries& h = *entries_.at(dev).handle;
            const auto labels = flat_labels(dev, h.shape());
            const std::size_t cells = labels.size();
            std::vector<double> values(ntime * cells);
            for (std::size_t c = 0; c < cells; ++c)
            {
                const std::size_t row = index.get(labels[c]);
                for (std::size_t t = 0; t < ntime; ++t)
                    values[t * cells + c] = data[row * ntime + t];
            }
            h.adjust(window, std::move(values));
        }
        LOGD("read flat variable `%s` (%zu devices)\n", name_.c_str(), order_.size());
        return;
    }

    const auto stride = strides_of(fshape);
    for (const auto& dev : order_)
    {
        series::ISeries& h = *entries_.at(dev).handle;
        const auto& ext = h.shape();
        if (ext.size() + 2 > fshape.size())
            throw Error(ErrorKind::InvalidArgument,
                        "Variable `" + name_ + "` of file `" + file.path() + "` has shape " +
                            join_shape(fshape) + ", which does not fit the " +
                            std::to_string(ext.size()) + "-dimensional sequence of device `" +
                            dev + "`.");
        for (std::size_t k = 0; k < ext.size(); ++k)
            if (ext[k] > fshape[k + 2])
                throw Error(ErrorKind::InvalidArgument,
                            "The sequence of device `" + dev + "` has shape " + join_shape(ext) +
                                ", which exceeds the shape " + join_shape(fshape) +
                                " of variable `" + name_ + "` in file `" + file.path() + "`.");

        const std::size_t row = index.get(dev);
        const std::size_t cells = cells_of(ext);
        std::vector<double> values(ntime * cells);
        for (std::size_t c = 0; c < cells; ++c)
        {
            const auto idx = unravel(c, ext);
            std::size_t off = row * stride[0];
            for (std::size_t k = 0; k < idx.size(); ++k)
                off += idx[k] * stride[k + 2];
            for (std::size_t t = 0; t < ntime; ++t)
                values[t * cells + c] = data[off + t * stride[1]];
        }
        h.adjust(window, std::move(values));
    }
    LOGD("read deep variable `%s` (%zu devices)\n", name_.c_str(), order_.size());
}

void Variable::write(ArrayFile& file) const
{
    insert_subdevicenames(file);
    const auto dims = dimensions();
    const auto s = shape();
    for (std::size_t k = 2; k < dims.size(); ++k)
        file.create_dimension(dims[k], s[k]);
    file.create_variable(name_, DType::Float64, dims, names_.fill_value);
    file.write_doubles(name_, array());
    LOGD("wrote %s variable `%s` with shape %s\n", to_string(kind_), name_.c_str(),
         join_shape(s).c_str());
}

} // namespace seriesio::io
