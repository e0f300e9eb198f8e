/*
 * Copyright (c) 2022 BedRock Systems, Inc.
 *
 * This software is distributed under the terms of the BedRock Open-Source License.
 * See the LICENSE-BedRock file in the repository root for details.
 */
#pragma once

#include <platform/types.hpp>
#include <sys/mman.h>

namespace Platform::Mem {

    static constexpr int READ = PROT_READ;
    static constexpr int WRITE = PROT_WRITE;

    /*! \brief Map zero-filled anonymous memory, page aligned
     *  \return the mapping or nullptr on failure
     */
    inline void *map_anon(size_t size, int flags) {
        void *p = mmap(nullptr, size, flags, MAP_PRIVATE | MAP_ANONYMOUS, -1, 0);
        if (p == MAP_FAILED)
            return nullptr;
        return p;
    }

    inline bool unmap_mem(const void *addr, size_t length) {
        int r = munmap(const_cast<void *>(addr), length);
        if (r != 0)
            return false;
        return true;
    }
};
