// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#ifndef __COMBINATION_SAMPLER_H
#define __COMBINATION_SAMPLER_H 1

#include <vector>
#include <numeric>
#include <algorithm>
#include <cstddef>
#include "RngUtils.h"

namespace parlayrec
{
  /**
   * @brief Draw k distinct indices from [0, populationSize) uniformly at random.
   *
   * Partial Fisher-Yates: only the first k positions of the index vector are
   * shuffled. The returned indices are in draw order, not sorted.
   *
   * @return empty when k == 0 or k > populationSize
   */
  template <class Rng>
  std::vector<std::size_t> sampleWithoutReplacement(std::size_t populationSize,
						    std::size_t k,
						    Rng& rng)
  {
    if (k == 0 || k > populationSize)
      return {};

    std::vector<std::size_t> indices(populationSize);
    std::iota(indices.begin(), indices.end(), 0);

    for (std::size_t i = 0; i < k; ++i)
      {
	// j in [i, populationSize)
	const std::size_t j = i + rng_utils::get_random_index(rng, populationSize - i);
	std::swap(indices[i], indices[j]);
      }

    indices.resize(k);
    return indices;
  }
}

#endif
