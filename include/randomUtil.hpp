#pragma once
#include <raylib.h>

// Thin helpers over raylib's GetRandomValue so every random draw in the game
// goes through the same seedable generator (SetRandomSeed).

// Stays below the smallest RAND_MAX (32767) raylib may fall back to
#define RANDOM_UNIT_STEPS 10000

/**
 * @brief Uniform draw in [0, 1], both ends inclusive.
 */
inline float RandomUnit()
{
    return (float)GetRandomValue(0, RANDOM_UNIT_STEPS) / (float)RANDOM_UNIT_STEPS;
}

/**
 * @brief Uniform index in [0, count). `count` must be positive.
 */
inline int RandomIndex(int count)
{
    return GetRandomValue(0, count - 1);
}

inline bool RandomCoinFlip()
{
    return RandomUnit() > 0.5f;
}
