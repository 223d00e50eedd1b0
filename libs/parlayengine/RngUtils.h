#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <random>
#include <type_traits>
#include <utility>

namespace parlayrec
{
  namespace rng_utils
  {
    // randutils::mt19937_rng exposes its engine through engine(); std engines are used directly
    template <typename T, typename = void>
    struct has_engine_method : std::false_type {};

    template <typename T>
    struct has_engine_method<T, std::void_t<decltype(std::declval<T&>().engine())>> : std::true_type {};

    template <typename Rng>
    inline auto& get_engine(Rng& rng)
    {
      if constexpr (has_engine_method<Rng>::value)
	return rng.engine();
      else
	return rng;
    }

    /// Unbiased index in [0, bound); 0 when bound is 0
    template <typename Rng>
    inline std::size_t get_random_index(Rng& rng, std::size_t bound)
    {
      if (bound == 0)
	return 0;

      std::uniform_int_distribution<std::size_t> dist(0, bound - 1);
      return dist(get_engine(rng));
    }

    /**
     * @brief Standard engine seeded from the 64-bit --seed value.
     *
     * Eight 32-bit seed words are taken from a SplitMix64 stream started at
     * the seed, so adjacent seeds give unrelated draw sequences.
     */
    template <class Engine>
    inline Engine make_seeded_engine(std::uint64_t seed)
    {
      std::array<std::uint32_t, 8> words;
      std::uint64_t state = seed;

      for (std::size_t i = 0; i < words.size(); i += 2)
	{
	  state += 0x9e3779b97f4a7c15ull;
	  std::uint64_t z = state;
	  z = (z ^ (z >> 30)) * 0xbf58476d1ce4e5b9ull;
	  z = (z ^ (z >> 27)) * 0x94d049bb133111ebull;
	  z ^= (z >> 31);

	  words[i] = static_cast<std::uint32_t>(z);
	  words[i + 1] = static_cast<std::uint32_t>(z >> 32);
	}

      std::seed_seq sequence(words.begin(), words.end());
      return Engine(sequence);
    }
  }
}
