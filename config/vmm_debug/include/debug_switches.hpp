/*
 * Copyright (C) 2020 BedRock Systems, Inc.
 * All rights reserved.
 *
 * This software is distributed under the terms of the BedRock Open-Source License.
 * See the LICENSE-BedRock file in the repository root for details.
 */

#pragma once

/*! \file Simple Debugging facility for the virtqueue code
 */
namespace Debug {
    /*! \brief Compile-time switch for the per-operation trace of the queue engine.
     *  Tracing also requires current_level to be at least DETAILLED.
     */
    static constexpr bool TRACE_VIRTQUEUE = true;

    /*!
     * Reflect the level of debugging logic desired from the code.
     * Each library is responsible for its own usage of each level.
     */
    enum Level : unsigned int {
        NONE = 0,      /*!< No debugging enabled */
        CONDENSED = 1, /*!< Summarized debugging information/logic */
        DETAILLED = 2, /*!< Non-summarized debugging information/logic */
        FULL = 3,      /*!< All debugging facilities enabled - Very intrusive! */
    };

    /*! \brief Current debugging level. The final binary can change it at startup.
     */
    extern enum Level current_level;

    /*! \brief Should the queue engine trace every chain and completion?
     */
    bool trace_virtqueue();
};
