/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef IUPDATABLE_HPP
#define IUPDATABLE_HPP

/**
 * @file IUpdatable.hpp
 * @brief Interface for objects the host frame loop ticks once per frame
 *
 * The walkthrough core never measures time itself. Whatever drives the
 * frame (the demo's TimestepManager loop, a render callback, a test)
 * calls update() with the elapsed time.
 */

namespace Wayfinder {

class IUpdatable
{
public:
    virtual ~IUpdatable() = default;

    /**
     * @brief Per-frame update
     * @param deltaTime Time elapsed since last frame in seconds
     */
    virtual void update(float deltaTime) = 0;
};

} // namespace Wayfinder

#endif // IUPDATABLE_HPP
