/*
 * Copyright (C) 2020-2022 BedRock Systems, Inc.
 * All rights reserved.
 *
 * This software is distributed under the terms of the BedRock Open-Source License.
 * See the LICENSE-BedRock file in the repository root for details.
 */
#pragma once

/*! \file Basic Address Space representation of the guest memory
 */

#include <model/guest_memory.hpp>
#include <platform/rangemap.hpp>
#include <platform/types.hpp>

namespace Model {
    class SimpleAS;
};

/*! \brief Simple (static) Address space representation for the guest
 *
 * One contiguous range of guest RAM, backed by anonymous host memory that is
 * allocated in [construct] and released in [destruct].
 */
class Model::SimpleAS : public Model::GuestMemory {
public:
    /*! \brief Construct a Simple AS
     *  \pre Nothing
     *  \post Full ownership of Simple AS. No memory is backing it until construct is called.
     *  \param read_only is the AS read-only from the device point of view?
     */
    explicit SimpleAS(bool read_only = false) : _name("SimpleAS"), _read_only(read_only) {}

    /*! \brief Construct a Simple AS
     *  \param name name of the AS, used in logs. Must outlive the object.
     *  \param read_only is the AS read-only from the device point of view?
     */
    SimpleAS(const char *name, bool read_only) : _name(name), _read_only(read_only) {}

    SimpleAS(const SimpleAS &) = delete;
    SimpleAS &operator=(const SimpleAS &) = delete;

    virtual ~SimpleAS() override { destruct(); }

    /*! \brief Allocate the backing memory of this AS
     *  \param guest_base first guest physical address of the AS
     *  \param size size of the AS in bytes
     *  \return true on success. false if the AS is already constructed, if the range
     *          is empty or wraps around, or if the allocation failed.
     */
    bool construct(GPA guest_base, size_t size);
    bool destruct();

    /*! \brief Get the size of this AS
     */
    uint64 get_size() const { return _as.size(); }

    const char *name() const { return _name; }

    /*! \brief Is the given GPA valid in this AS?
     *  \param addr Guest physical address to test
     *  \param sz Size of the access
     *  \return true if [addr, addr + sz) belongs to this AS, false otherwise.
     */
    virtual bool is_gpa_valid(GPA addr, size_t sz) const override;

    /*! \brief Query the base of the address space from the guest point of view
     */
    GPA get_guest_view() const { return GPA(_as.begin()); }

    /*! \brief Query the base of the address space from the VMM point of view
     *  \return Address representing the beginning of the mapping of the guest AS
     */
    char *get_vmm_view() const { return _vmm_view; };

    virtual char *gpa_to_vmm_view(GPA addr, size_t sz) const override;
    virtual char *gpa_to_vmm_view_write(GPA addr, size_t sz) const override;

    bool is_read_only() const { return _read_only; }
    bool mapped() const { return (_vmm_view != nullptr); }

protected:
    const char *_name;
    const bool _read_only;    /*!< Is the AS read-only from the device point of view? */
    char *_vmm_view{nullptr}; /*!< base host mapping of base gpa. */
    Range<mword> _as;         /*!< Range(gpa RAM base, guest RAM size) */
};
