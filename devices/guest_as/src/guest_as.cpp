/**
 * Copyright (C) 2020 BedRock Systems, Inc.
 * All rights reserved.
 *
 * This software is distributed under the terms of the BedRock Open-Source License.
 * See the LICENSE-BedRock file in the repository root for details.
 */

#include <model/guest_as.hpp>
#include <platform/log.hpp>
#include <new>

Model::GuestAS::~GuestAS() {
    _regions.clear(destroy_region);
}

Errno
Model::GuestAS::add_region(GPA base, size_t size, bool read_only) {
    GPA last;

    if (size == 0 or base.checked_add(size - 1, last) != Errno::NONE) {
        WARN("Invalid guest region base " FMTx64 " size %zu", base.value(), size);
        return Errno::INVAL;
    }

    Range<mword> range(base.get_value(), size);
    if (_regions.overlaps(range)) {
        WARN("Guest region [" FMTx64 ":" FMTx64 "] overlaps an existing region", base.value(), last.value());
        return Errno::INVAL;
    }

    Model::SimpleAS *as = new (std::nothrow) Model::SimpleAS("GuestRAM", read_only);
    if (as == nullptr)
        return Errno::NOMEM;

    if (!as->construct(base, size)) {
        delete as;
        return Errno::NOMEM;
    }

    Region *region = new (std::nothrow) Region(range, as);
    if (region == nullptr) {
        delete as;
        return Errno::NOMEM;
    }

    if (!_regions.insert(region)) {
        delete region;
        return Errno::INVAL;
    }

    return Errno::NONE;
}

Errno
Model::GuestAS::remove_region(GPA base) {
    RangeNode<mword> *node = _regions.remove(Range<mword>(base.get_value(), 1));
    if (node == nullptr)
        return Errno::NOENT;

    delete static_cast<Region *>(node);
    return Errno::NONE;
}

const Model::SimpleAS *
Model::GuestAS::region_at(GPA addr, size_t sz) const {
    GPA last;

    if (sz == 0 or addr.checked_add(sz - 1, last) != Errno::NONE)
        return nullptr;

    const Region *region = static_cast<const Region *>(_regions.lookup(Range<mword>(addr.get_value(), sz)));
    if (region == nullptr or !region->as()->is_gpa_valid(addr, sz))
        return nullptr;

    return region->as();
}

bool
Model::GuestAS::is_gpa_valid(GPA addr, size_t sz) const {
    return region_at(addr, sz) != nullptr;
}

char *
Model::GuestAS::gpa_to_vmm_view(GPA addr, size_t sz) const {
    const Model::SimpleAS *as = region_at(addr, sz);
    return as == nullptr ? nullptr : as->gpa_to_vmm_view(addr, sz);
}

char *
Model::GuestAS::gpa_to_vmm_view_write(GPA addr, size_t sz) const {
    const Model::SimpleAS *as = region_at(addr, sz);
    return as == nullptr ? nullptr : as->gpa_to_vmm_view_write(addr, sz);
}
