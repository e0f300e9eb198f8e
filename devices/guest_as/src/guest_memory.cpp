/**
 * Copyright (c) 2019-2022 BedRock Systems, Inc.
 * This software is distributed under the terms of the BedRock Open-Source License.
 * See the LICENSE-BedRock file in the repository root for details.
 */

#include <model/guest_memory.hpp>
#include <platform/compiler.hpp>

Errno
Model::GuestMemory::read(char *dst, size_t size, const GPA &addr) const {
    if (size == 0)
        return Errno::NONE;

    const char *src = gpa_to_vmm_view(addr, size);
    if (__UNLIKELY__(src == nullptr))
        return Errno::FAULT;

    memcpy(dst, src, size);
    return Errno::NONE;
}

Errno
Model::GuestMemory::write(const GPA &addr, size_t size, const char *src) const {
    if (size == 0)
        return Errno::NONE;

    char *dst = gpa_to_vmm_view_write(addr, size);
    if (__UNLIKELY__(dst == nullptr))
        return is_gpa_valid(addr, size) ? Errno::PERM : Errno::FAULT;

    memcpy(dst, src, size);
    return Errno::NONE;
}
