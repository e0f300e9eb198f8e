/*
 * Copyright (C) 2020 BedRock Systems, Inc.
 * All rights reserved.
 *
 * This software is distributed under the terms of the BedRock Open-Source License.
 * See the LICENSE-BedRock file in the repository root for details.
 */
#pragma once

#include <model/guest_memory.hpp>
#include <model/simple_as.hpp>
#include <platform/rangemap.hpp>
#include <platform/types.hpp>

namespace Model {
    class GuestAS;
};

/*! \brief Guest physical address space made of several RAM regions
 *
 * Regions never overlap. A single access is only valid if it lies entirely
 * within one region, even when two regions are adjacent.
 */
class Model::GuestAS : public Model::GuestMemory {
public:
    GuestAS() {}
    GuestAS(const GuestAS &) = delete;
    GuestAS &operator=(const GuestAS &) = delete;

    virtual ~GuestAS() override;

    /*! \brief Back [base, base + size) with fresh zeroed memory
     *  \param base first guest physical address of the region
     *  \param size size of the region in bytes
     *  \param read_only can the device write to the region?
     *  \return NONE on success, INVAL if the range is empty, wraps around or
     *          overlaps an existing region, NOMEM if the memory cannot be allocated
     */
    Errno add_region(GPA base, size_t size, bool read_only = false);

    /*! \brief Release the region that contains [base]
     *  \return NONE on success, NOENT if no region contains [base]
     */
    Errno remove_region(GPA base);

    /*! \brief Find the region that holds [addr, addr + sz)
     *  \return the region, or nullptr if no single region holds the range
     */
    const Model::SimpleAS *region_at(GPA addr, size_t sz) const;

    size_t num_regions() const { return _regions.size(); }

    virtual bool is_gpa_valid(GPA addr, size_t sz) const override;
    virtual char *gpa_to_vmm_view(GPA addr, size_t sz) const override;
    virtual char *gpa_to_vmm_view_write(GPA addr, size_t sz) const override;

private:
    class Region : public RangeNode<mword> {
    public:
        Region(const Range<mword> &r, Model::SimpleAS *as) : RangeNode<mword>(r), _as(as) {}
        ~Region() { delete _as; }

        Model::SimpleAS *as() const { return _as; }

    private:
        Model::SimpleAS *_as;
    };

    static void destroy_region(Region *r) { delete r; }

    RangeMap<mword> _regions;
};
