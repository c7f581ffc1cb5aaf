/**
 * @file Tensor.cpp
 * @brief Tensor class function definitions.
 */

#include "neuron/Tensor.hpp"
#include "neuron/Elementwise.hpp"
#include "neuron/Utils.hpp"
#include "neuron/Errors.hpp"

#include <limits>
#include <string>

namespace neuron
{

namespace
{

/// Product of @p dims, rejecting empty shapes, zero axes and overflow.
uint64_t checked_count(const std::vector<uint64_t> & dims)
{
    NEURON_CHECK(dims.empty(),
        validation_error,
        R"(Tensor: dims must not be empty (rank-0 not supported).)");

    constexpr uint64_t U64_MAX = std::numeric_limits<uint64_t>::max();

    uint64_t count = 1;
    for (uint64_t d : dims)
    {
        NEURON_CHECK(d == 0,
            validation_error,
            R"(Tensor: zero-sized dimension is not allowed.)");

        NEURON_CHECK(count > U64_MAX / d,
            bounds_error,
            R"(Tensor: total element count overflow.)");

        count *= d;
    }
    return count;
}

/// Zero-filled USM shared buffer of @p count elements.
template<typename value_t>
std::shared_ptr<value_t> make_buffer(uint64_t count)
{
    NEURON_CHECK(count > std::numeric_limits<size_t>::max() / sizeof(value_t),
        bounds_error,
        R"(Tensor: allocation size doesn't fit into size_t.)");

    const size_t bytes = static_cast<size_t>(count) * sizeof(value_t);

    const uint64_t max_alloc = g_sycl_queue.get_device()
        .get_info<sycl::info::device::max_mem_alloc_size>();

    NEURON_CHECK(bytes > max_alloc,
        device_error,
        R"(Tensor: requested allocation exceeds max_mem_alloc_size.)");

    value_t* raw = static_cast<value_t*>(
        sycl::malloc_shared(bytes, g_sycl_queue));

    NEURON_CHECK(!raw,
        device_error,
        R"(Tensor: error allocating tensor memory.)");

    g_sycl_queue.memset(raw, 0, bytes).wait();

    return std::shared_ptr<value_t>(raw,
        [](value_t* p) { sycl::free(p, g_sycl_queue); });
}

} // namespace

template<typename value_t>
void Tensor<value_t>::compute_strides()
{
    m_strides = utils::compute_divisors(m_dimensions);
}

template<typename value_t>
Tensor<value_t>::Tensor(const std::vector<uint64_t> & dimensions)
    : m_dimensions(dimensions)
{
    const uint64_t count = checked_count(m_dimensions);
    compute_strides();
    m_p_data = make_buffer<value_t>(count);
}

template<typename value_t>
Tensor<value_t>::Tensor(std::initializer_list<uint64_t> dimensions)
    : Tensor(std::vector<uint64_t>(dimensions))
{
}

template<typename value_t>
Tensor<value_t>::Tensor(value_t val)
    : Tensor(std::vector<uint64_t>{1})
{
    *m_p_data = val;
}

template<typename value_t>
Tensor<value_t>::Tensor(const Tensor & other)
    : m_p_data(other.m_p_data),
      m_dimensions(other.m_dimensions),
      m_strides(other.m_strides),
      m_own_data(other.m_own_data)
{
    if (!m_own_data || m_dimensions.empty())
    {
        return;
    }

    const uint64_t count = other.get_num_elements();
    m_p_data = make_buffer<value_t>(count);
    g_sycl_queue.memcpy(m_p_data.get(), other.m_p_data.get(),
        static_cast<size_t>(count) * sizeof(value_t)).wait();
}

template<typename value_t>
Tensor<value_t>::Tensor(Tensor && other) noexcept
    : m_p_data(std::move(other.m_p_data)),
      m_dimensions(std::move(other.m_dimensions)),
      m_strides(std::move(other.m_strides)),
      m_own_data(other.m_own_data)
{
    other.m_dimensions.clear();
    other.m_strides.clear();
    other.m_own_data = true;
}

template<typename value_t>
Tensor<value_t>::Tensor(const Tensor & owner,
    const std::vector<uint64_t> & start_indices,
    const std::vector<uint64_t> & view_shape)
    : m_own_data(false)
{
    const uint64_t owner_rank = owner.m_dimensions.size();
    const uint64_t view_rank = view_shape.size();

    NEURON_CHECK(!owner.m_p_data,
        validation_error,
        R"(Tensor(view constructor):
            cannot create view from uninitialized tensor.)");

    NEURON_CHECK(start_indices.size() != owner_rank,
        validation_error,
        R"(Tensor(view constructor):
            start_indices must match tensor rank.)");

    NEURON_CHECK(view_rank == 0 || view_rank > owner_rank,
        validation_error,
        R"(Tensor(view constructor):
            view shape rank must be between 1 and tensor rank.)");

    uint64_t offset = 0;
    for (uint64_t i = 0; i < owner_rank; ++i)
    {
        NEURON_CHECK(start_indices[i] >= owner.m_dimensions[i],
            bounds_error,
            R"(Tensor(view constructor): start index out of bounds.)");
        offset += start_indices[i] * owner.m_strides[i];
    }

    // The view spans the trailing axes of the owner.
    const uint64_t first_axis = owner_rank - view_rank;
    for (uint64_t j = 0; j < view_rank; ++j)
    {
        NEURON_CHECK(view_shape[j] == 0 || start_indices[first_axis + j] +
            view_shape[j] > owner.m_dimensions[first_axis + j],
            bounds_error,
            R"(Tensor(view constructor): view shape out of bounds.)");
    }

    m_dimensions = view_shape;
    m_strides.assign(owner.m_strides.begin() + first_axis,
        owner.m_strides.end());
    m_p_data = std::shared_ptr<value_t>(owner.m_p_data,
        owner.m_p_data.get() + offset);
}

template<typename value_t>
Tensor<value_t>::Tensor(const Tensor & owner,
    const std::vector<uint64_t> & start_indices,
    const std::vector<uint64_t> & dims,
    const std::vector<uint64_t> & strides)
    : m_dimensions(dims),
      m_strides(strides),
      m_own_data(false)
{
    const uint64_t owner_rank = owner.m_dimensions.size();

    NEURON_CHECK(!owner.m_p_data,
        validation_error,
        R"(Tensor(alias view constructor):
            cannot create view from uninitialized tensor.)");

    NEURON_CHECK(start_indices.size() != owner_rank,
        validation_error,
        R"(Tensor(alias view constructor):
            start_indices must match owner's rank.)");

    NEURON_CHECK(dims.empty() || strides.size() != dims.size(),
        validation_error,
        R"(Tensor(alias view constructor):
            dims and strides must have the same non-zero rank.)");

    uint64_t offset = 0;
    uint64_t owner_last = 0;
    for (uint64_t i = 0; i < owner_rank; ++i)
    {
        NEURON_CHECK(start_indices[i] >= owner.m_dimensions[i],
            bounds_error,
            R"(Tensor(alias view constructor): start index out of bounds.)");
        offset += start_indices[i] * owner.m_strides[i];
        owner_last += (owner.m_dimensions[i] - 1) * owner.m_strides[i];
    }

    uint64_t view_last = offset;
    for (uint64_t j = 0; j < dims.size(); ++j)
    {
        NEURON_CHECK(dims[j] == 0,
            validation_error,
            R"(Tensor(alias view constructor):
                view dimensions must be non-zero.)");
        view_last += (dims[j] - 1) * strides[j];
    }

    NEURON_CHECK(view_last > owner_last,
        bounds_error,
        R"(Tensor(alias view constructor): view exceeds owner's buffer.)");

    m_p_data = std::shared_ptr<value_t>(owner.m_p_data,
        owner.m_p_data.get() + offset);
}

template<typename value_t>
Tensor<value_t> & Tensor<value_t>::operator=(const Tensor & other)
{
    if (this != &other)
    {
        *this = Tensor(other);
    }
    return *this;
}

template<typename value_t>
Tensor<value_t> & Tensor<value_t>::operator=(Tensor && other) noexcept
{
    if (this != &other)
    {
        m_p_data = std::move(other.m_p_data);
        m_dimensions = std::move(other.m_dimensions);
        m_strides = std::move(other.m_strides);
        m_own_data = other.m_own_data;

        other.m_dimensions.clear();
        other.m_strides.clear();
        other.m_own_data = true;
    }
    return *this;
}

template<typename value_t>
Tensor<value_t> & Tensor<value_t>::operator=(const std::vector<value_t> & values)
{
    NEURON_CHECK(m_dimensions.empty(),
        validation_error,
        R"(Tensor(values assignment): target tensor has no elements.)");

    NEURON_CHECK(values.size() != this->get_num_elements(),
        validation_error,
        R"(Tensor(values assignment): size mismatch.)");

    if (m_strides == utils::compute_divisors(m_dimensions))
    {
        g_sycl_queue.memcpy(m_p_data.get(), values.data(),
            values.size() * sizeof(value_t)).wait();
        return *this;
    }

    Tensor<value_t> staged(m_dimensions);
    staged = values;
    kernels::copy_into(*this, staged, "Tensor(values assignment)");
    return *this;
}

template<typename value_t>
Tensor<value_t> & Tensor<value_t>::operator=(value_t val)
{
    if (m_dimensions.empty())
    {
        *this = Tensor(val);
        return *this;
    }

    NEURON_CHECK(this->get_num_elements() != 1,
        validation_error,
        R"(Tensor(single value assignment):
            scalar assignment only allowed for tensors with single element.)");

    *m_p_data = val;
    return *this;
}

template<typename value_t>
Tensor<value_t> Tensor<value_t>::operator[](uint64_t idx)
{
    return static_cast<const Tensor &>(*this)[idx];
}

template<typename value_t>
const Tensor<value_t> Tensor<value_t>::operator[](uint64_t idx) const
{
    NEURON_CHECK(m_dimensions.empty(),
        validation_error,
        R"(Tensor(operator[]): tensor has no elements.)");

    NEURON_CHECK(idx >= m_dimensions[0],
        bounds_error,
        R"(Tensor(operator[]): Index out of bounds.)");

    std::vector<uint64_t> start(m_dimensions.size(), 0);
    start[0] = idx;

    std::vector<uint64_t> slice_shape(m_dimensions.begin() + 1,
        m_dimensions.end());
    if (slice_shape.empty())
    {
        slice_shape.push_back(1);
    }

    return Tensor(*this, start, slice_shape);
}

template<typename value_t>
Tensor<value_t>::operator value_t() const
{
    NEURON_CHECK(this->get_num_elements() != 1,
        validation_error,
        R"(Tensor(implicit type conversion):
            scalar read only allowed for tensors with single element.)");

    return *m_p_data;
}

template<typename value_t>
Tensor<value_t> Tensor<value_t>::operator+(const Tensor & other) const
{
    return kernels::zip(*this, other,
        [](value_t a, value_t b) { return a + b; }, "Tensor(operator+)");
}

template<typename value_t>
Tensor<value_t> Tensor<value_t>::operator-(const Tensor & other) const
{
    return kernels::zip(*this, other,
        [](value_t a, value_t b) { return a - b; }, "Tensor(operator-)");
}

template<typename value_t>
Tensor<value_t> Tensor<value_t>::operator*(const Tensor & other) const
{
    return kernels::zip(*this, other,
        [](value_t a, value_t b) { return a * b; }, "Tensor(operator*)");
}

template<typename value_t>
Tensor<value_t> Tensor<value_t>::operator/(const Tensor & other) const
{
    return kernels::zip(*this, other,
        [](value_t a, value_t b) { return a / b; }, "Tensor(operator/)");
}

template<typename value_t>
Tensor<value_t> Tensor<value_t>::operator-() const
{
    return kernels::map(*this,
        [](value_t a) { return -a; }, "Tensor(unary operator-)");
}

template<typename value_t>
Tensor<value_t> Tensor<value_t>::operator+(value_t scalar) const
{
    return kernels::map(*this,
        [scalar](value_t a) { return a + scalar; }, "Tensor(scalar operator+)");
}

template<typename value_t>
Tensor<value_t> Tensor<value_t>::operator-(value_t scalar) const
{
    return kernels::map(*this,
        [scalar](value_t a) { return a - scalar; }, "Tensor(scalar operator-)");
}

template<typename value_t>
Tensor<value_t> Tensor<value_t>::operator*(value_t scalar) const
{
    return kernels::map(*this,
        [scalar](value_t a) { return a * scalar; }, "Tensor(scalar operator*)");
}

template<typename value_t>
Tensor<value_t> Tensor<value_t>::operator/(value_t scalar) const
{
    return kernels::map(*this,
        [scalar](value_t a) { return a / scalar; }, "Tensor(scalar operator/)");
}

template<typename value_t>
bool Tensor<value_t>::operator==(const Tensor & other) const
{
    if (m_dimensions != other.m_dimensions)
    {
        return false;
    }
    if (m_dimensions.empty())
    {
        return true;
    }

    Tensor<value_t> mismatches = kernels::zip(*this, other,
        [](value_t a, value_t b)
        {
            return a == b ? static_cast<value_t>(0) : static_cast<value_t>(1);
        },
        "Tensor(operator==)");

    return kernels::reduce_sum(mismatches,
        [](value_t v) { return v; }, "Tensor(operator==)") ==
        static_cast<value_t>(0);
}

template<typename value_t>
bool Tensor<value_t>::operator!=(const Tensor & other) const
{
    return !(*this == other);
}

template<typename value_t>
Tensor<value_t> Tensor<value_t>::clone() const
{
    return kernels::map(*this,
        [](value_t a) { return a; }, "Tensor(clone)");
}

template<typename value_t>
Tensor<value_t> Tensor<value_t>::transpose() const
{
    NEURON_CHECK(m_dimensions.empty(),
        validation_error,
        R"(Tensor(transpose): cannot transpose an empty tensor.)");

    const std::vector<uint64_t> start(m_dimensions.size(), 0);

    if (m_dimensions.size() == 1)
    {
        return Tensor(*this, start, {m_dimensions[0], 1}, {m_strides[0], 1});
    }

    return Tensor(*this, start,
        std::vector<uint64_t>(m_dimensions.rbegin(), m_dimensions.rend()),
        std::vector<uint64_t>(m_strides.rbegin(), m_strides.rend()));
}

template<typename value_t>
std::vector<value_t> Tensor<value_t>::to_vector() const
{
    if (m_dimensions.empty())
    {
        return {};
    }

    if (m_own_data)
    {
        const value_t* p = m_p_data.get();
        return std::vector<value_t>(p, p + this->get_num_elements());
    }

    const Tensor<value_t> contiguous = this->clone();
    const value_t* p = contiguous.get_data();
    return std::vector<value_t>(p, p + contiguous.get_num_elements());
}

template<typename value_t>
void Tensor<value_t>::print(std::ostream & os) const
{
    if (m_dimensions.empty())
    {
        os << "[]\n";
        return;
    }

    const std::vector<value_t> values = this->to_vector();
    const std::vector<uint64_t> divs = utils::compute_divisors(m_dimensions);
    const uint64_t rank = m_dimensions.size();

    for (uint64_t i = 0; i < values.size(); ++i)
    {
        // Number of axes whose block starts at element i.
        uint64_t opening = rank;
        if (i > 0)
        {
            opening = 0;
            for (uint64_t d = 0; d < rank; ++d)
            {
                if (i % (divs[d] * m_dimensions[d]) == 0)
                {
                    ++opening;
                }
            }
            os << std::string(opening, ']') << ", ";
            if (opening > 0)
            {
                os << "\n" << std::string(rank - opening, ' ');
            }
        }
        os << std::string(opening, '[') << values[i];
    }
    os << std::string(rank, ']') << "\n";
}

template<typename value_t>
void Tensor<value_t>::print_shape(std::ostream & os) const
{
    os << "[";
    for (size_t i = 0; i < m_dimensions.size(); ++i)
    {
        os << (i > 0 ? ", " : "") << m_dimensions[i];
    }
    os << "]\n";
}

template<typename value_t>
const value_t * Tensor<value_t>::get_data() const noexcept
{
    return m_p_data.get();
}

template<typename value_t>
value_t * Tensor<value_t>::get_data() noexcept
{
    return m_p_data.get();
}

template<typename value_t>
const std::vector<uint64_t> & Tensor<value_t>::get_dimensions() const noexcept
{
    return m_dimensions;
}

template<typename value_t>
const std::vector<uint64_t> & Tensor<value_t>::get_strides() const noexcept
{
    return m_strides;
}

template<typename value_t>
int64_t Tensor<value_t>::get_rank() const noexcept
{
    return static_cast<int64_t>(m_dimensions.size());
}

template<typename value_t>
uint64_t Tensor<value_t>::get_num_elements() const noexcept
{
    return utils::count_elements(m_dimensions);
}

template<typename value_t>
bool Tensor<value_t>::get_owns_data() const noexcept
{
    return m_own_data;
}

template class Tensor<float>;

} // namespace neuron
