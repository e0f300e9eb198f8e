/**
 * Copyright (C) 2020 BedRock Systems, Inc.
 * All rights reserved.
 *
 * This software is distributed under the terms of the BedRock Open-Source License.
 * See the LICENSE-BedRock file in the repository root for details.
 */

#include <model/simple_as.hpp>
#include <platform/compiler.hpp>
#include <platform/log.hpp>
#include <platform/mem.hpp>

bool
Model::SimpleAS::construct(GPA guest_base, size_t size) {
    GPA last;

    if (mapped()) {
        WARN("%s: already constructed", _name);
        return false;
    }

    if (size == 0 or guest_base.checked_add(size - 1, last) != Errno::NONE) {
        WARN("%s: invalid range base " FMTx64 " size %zu", _name, guest_base.value(), size);
        return false;
    }

    void *mem = Platform::Mem::map_anon(size, Platform::Mem::READ | Platform::Mem::WRITE);
    if (mem == nullptr) {
        ERROR("%s: unable to allocate %zu bytes of guest memory", _name, size);
        return false;
    }

    _vmm_view = static_cast<char *>(mem);
    _as = Range<mword>(guest_base.value(), size);
    return true;
}

bool
Model::SimpleAS::destruct() {
    if (!mapped())
        return true;

    bool ok = Platform::Mem::unmap_mem(_vmm_view, _as.size());
    if (!ok)
        ERROR("%s: unable to release guest memory", _name);

    _vmm_view = nullptr;
    _as = Range<mword>();
    return ok;
}

bool
Model::SimpleAS::is_gpa_valid(GPA addr, size_t sz) const {
    GPA last;

    if (sz == 0 or addr.checked_add(sz - 1, last) != Errno::NONE)
        return false;

    return _as.contains(Range<mword>(addr.get_value(), sz));
}

char *
Model::SimpleAS::gpa_to_vmm_view(GPA addr, size_t sz) const {
    if (__UNLIKELY__(!mapped() or !is_gpa_valid(addr, sz)))
        return nullptr;

    return _vmm_view + (addr.get_value() - _as.begin());
}

char *
Model::SimpleAS::gpa_to_vmm_view_write(GPA addr, size_t sz) const {
    if (_read_only)
        return nullptr;

    return gpa_to_vmm_view(addr, sz);
}
