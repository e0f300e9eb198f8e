/**
 * Copyright (c) 2019-2022 BedRock Systems, Inc.
 * This software is distributed under the terms of the BedRock Open-Source License.
 * See the LICENSE-BedRock file in the repository root for details.
 */
#pragma once

/*! \file Abstract view of the guest memory, as seen by a device model
 */

#include <cstring>

#include <platform/atomic.hpp>
#include <platform/bits.hpp>
#include <platform/endian.hpp>
#include <platform/errno.hpp>
#include <platform/log.hpp>
#include <platform/types.hpp>

namespace Model {
    class GuestMemory;
};

/*! \brief Simple Wrapper for primitive types.
 */
template<typename T>
class PrimitiveTypeWrapper {
public:
    PrimitiveTypeWrapper() = delete;
    PrimitiveTypeWrapper(T value) : _value(value) {} // NOLINT
    PrimitiveTypeWrapper(const PrimitiveTypeWrapper &other) : _value(other._value) {}

    void set_value(T value) { _value = value; }
    T get_value() const { return _value; }
    T value() const { return _value; }

    bool operator==(const T &value) const { return value == _value; }
    bool operator!=(const T &value) const { return value != _value; }
    bool operator==(const PrimitiveTypeWrapper &other) const { return _value == other._value; }
    bool operator!=(const PrimitiveTypeWrapper &other) const { return _value != other._value; }
    PrimitiveTypeWrapper &operator=(const T value) {
        _value = value;
        return *this;
    }
    PrimitiveTypeWrapper &operator=(const PrimitiveTypeWrapper &other) {
        _value = other._value;
        return *this;
    }
    T operator()(void) const { return _value; }

    bool operator<(const PrimitiveTypeWrapper &other) const { return _value < other._value; }
    bool operator<=(const PrimitiveTypeWrapper &other) const { return _value <= other._value; }
    bool operator>(const PrimitiveTypeWrapper &other) const { return _value > other._value; }
    bool operator>=(const PrimitiveTypeWrapper &other) const { return _value >= other._value; }

    T operator-(const PrimitiveTypeWrapper<T> &other) const { return _value - other._value; }
    T operator%(const T value) const { return _value % value; }

protected:
    T _value;
};

/*! \brief Guest Physical Address
 */
class GPA : public PrimitiveTypeWrapper<uint64> {
public:
    static constexpr uint64 INVALID_GPA = ~0ull;
    using PrimitiveTypeWrapper::PrimitiveTypeWrapper;

    GPA() : PrimitiveTypeWrapper<uint64>(INVALID_GPA) {}

    bool invalid(void) const { return _value == INVALID_GPA; }

    /*! \brief Compute this + off without wrapping around the address space
     *  \param off offset to add
     *  \param res receives the resulting address, untouched on failure
     *  \return ADDR_OVERFLOW if the sum does not fit on 64 bits, NONE otherwise
     */
    Errno checked_add(uint64 off, GPA &res) const {
        uint64 sum;

        if (__builtin_add_overflow(_value, off, &sum))
            return Errno::ADDR_OVERFLOW;

        res = GPA(sum);
        return Errno::NONE;
    }
};

/*! \brief Memory of the guest as seen by a device model
 *
 * Implementations expose a translation from guest physical addresses to host
 * pointers. Everything else (bulk copies, atomic accesses to ring fields) is
 * built on top of that translation here. Accesses must not straddle two
 * backing regions: [gpa_to_vmm_view] returns nullptr in that case.
 */
class Model::GuestMemory {
public:
    virtual ~GuestMemory() {}

    /*! \brief Is [addr, addr + sz) entirely backed by guest memory?
     *  \param addr Guest physical address to test
     *  \param sz Size of the access, an empty access is never valid
     */
    virtual bool is_gpa_valid(GPA addr, size_t sz) const = 0;

    /*! \brief Converts a GPA to an address valid for the VMM, for reading
     *  \return A valid pointer to memory if [addr, addr + sz) is valid. nullptr otherwise.
     */
    virtual char *gpa_to_vmm_view(GPA addr, size_t sz) const = 0;

    /*! \brief Converts a GPA to an address valid for the VMM, for writing
     *  \return A valid pointer to memory if [addr, addr + sz) is valid and writable.
     *          nullptr otherwise.
     */
    virtual char *gpa_to_vmm_view_write(GPA addr, size_t sz) const = 0;

    bool address_in_range(GPA addr) const { return is_gpa_valid(addr, 1); }

    /*! \brief Read data from the guest memory
     *  \param dst buffer that will receive the guest data
     *  \param size size to read
     *  \param addr start of the read on the guest AS
     *  \return NONE on success, FAULT if the range is not backed by guest memory
     */
    Errno read(char *dst, size_t size, const GPA &addr) const;

    /*! \brief Write data to the guest memory
     *  \return NONE on success, PERM if the range is read-only, FAULT if it is not
     *          backed by guest memory
     */
    Errno write(const GPA &addr, size_t size, const char *src) const;

    template<typename T>
    Errno read_obj(const GPA &addr, T &obj) const {
        return read(reinterpret_cast<char *>(&obj), sizeof(T), addr);
    }

    template<typename T>
    Errno write_obj(const GPA &addr, const T &obj) const {
        return write(addr, sizeof(T), reinterpret_cast<const char *>(&obj));
    }

    /*! \brief Single-copy atomic load of a little-endian scalar
     *  \param addr guest address, must be aligned on sizeof(T)
     *  \param o ordering of the load
     *  \param val receives the value in host byte order
     *  \return NONE on success, INVAL for a misaligned address or a store-only
     *          ordering, FAULT if the address is not backed by guest memory
     */
    template<typename T>
    Errno load(const GPA &addr, Ordering o, T &val) const {
        static_assert(sizeof(T) <= sizeof(uint64), "atomic access is at most 64-bit wide");

        if (!is_load_ordering(o)) {
            WARN("Ordering %s cannot be used for a load", ordering2str(o));
            return Errno::INVAL;
        }
        if (!is_aligned(addr.value(), sizeof(T)))
            return Errno::INVAL;

        char *p = gpa_to_vmm_view(addr, sizeof(T));
        if (p == nullptr)
            return Errno::FAULT;
        if (!is_aligned(reinterpret_cast<mword>(p), sizeof(T)))
            return Errno::INVAL;

        val = Endian::from_le(atomic_load(reinterpret_cast<const volatile T *>(p), o));
        return Errno::NONE;
    }

    /*! \brief Single-copy atomic store of a scalar, in little-endian byte order
     *  \return NONE on success, INVAL for a misaligned address or a load-only
     *          ordering, PERM for read-only memory, FAULT if the address is not backed
     *          by guest memory
     */
    template<typename T>
    Errno store(const GPA &addr, T val, Ordering o) const {
        static_assert(sizeof(T) <= sizeof(uint64), "atomic access is at most 64-bit wide");

        if (!is_store_ordering(o)) {
            WARN("Ordering %s cannot be used for a store", ordering2str(o));
            return Errno::INVAL;
        }
        if (!is_aligned(addr.value(), sizeof(T)))
            return Errno::INVAL;

        char *p = gpa_to_vmm_view_write(addr, sizeof(T));
        if (p == nullptr)
            return is_gpa_valid(addr, sizeof(T)) ? Errno::PERM : Errno::FAULT;
        if (!is_aligned(reinterpret_cast<mword>(p), sizeof(T)))
            return Errno::INVAL;

        atomic_store(reinterpret_cast<volatile T *>(p), Endian::to_le(val), o);
        return Errno::NONE;
    }
};
