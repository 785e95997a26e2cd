/**
 * @file
 *
 * @brief Classes representing those properties of CUDA devices which
 * determine whether they can be served by an MPS daemon.
 *
 */
#pragma once
#ifndef CUDAMPS_DEVICE_PROPERTIES_HPP_
#define CUDAMPS_DEVICE_PROPERTIES_HPP_

#include "types.hpp"

#include <stdexcept>
#include <string>

// The following un-definitions avoid warnings about
// the use of `major` and `minor` in certain versions
// of the GNU C library
#ifdef major
#undef major
#endif

#ifdef minor
#undef minor
#endif

namespace cudamps {

namespace device {

/**
 * A numeric designator of an architectural generation of CUDA devices
 *
 * @note See <a href="https://en.wikipedia.org/wiki/Category:Nvidia_microarchitectures">this listing</a>
 * of nVIDIA GPU microarchitectures; cf. @ref compute_capability_t .
 */
struct compute_architecture_t {
	/**
	 * A @ref compute_capability_t has a "major" and a "minor" number,
	 * with "major" indicating the architecture; so this struct only
	 * has a "major" number
	 */
	unsigned major;

	/**
	 * @returns the name NVIDIA has given this microarchitecture
	 *
	 * @note NVIDIA names their microarchitecture after famous scientists  like "Tesla", "Pascal" etc.
	 */
	const char* name() const;
};

/**
 * A numeric designator of the computational capabilities of a CUDA device
 *
 * @note MPS itself is only available on devices of compute capability 3.5 and
 * later, which is why the supervisor's default threshold is that value.
 */
struct compute_capability_t {

	/// The major capability designator
	compute_architecture_t architecture;

	/// The minor designator
	unsigned minor_;

	constexpr unsigned major() const { return architecture.major; }
	unsigned constexpr minor() const { return minor_; }

	/**
	 * Produces a single-number representation of the compute capability, e.g.
	 * 75 for major 7, minor 5.
	 */
	constexpr unsigned as_combined_number() const noexcept { return major() * 10 + minor_; }

	/// e.g. "7.5"
	::std::string as_string() const { return ::std::to_string(major()) + '.' + ::std::to_string(minor_); }
};

/**
 * @brief A named constructor idiom for {@ref compute_capability_t}.
 */
inline constexpr compute_capability_t make_compute_capability(unsigned major, unsigned minor) noexcept
{
	return { {major}, minor };
}

///@cond

inline constexpr bool operator ==(const compute_capability_t& lhs, const compute_capability_t& rhs) noexcept
{
	return lhs.major() == rhs.major() and lhs.minor_ == rhs.minor_;
}
inline constexpr bool operator !=(const compute_capability_t& lhs, const compute_capability_t& rhs) noexcept
{
	return lhs.major() != rhs.major() or lhs.minor_ != rhs.minor_;
}
inline constexpr bool operator <(const compute_capability_t& lhs, const compute_capability_t& rhs) noexcept
{
	return lhs.major() < rhs.major() or (lhs.major() == rhs.major() and lhs.minor_ < rhs.minor_);
}
inline constexpr bool operator <=(const compute_capability_t& lhs, const compute_capability_t& rhs) noexcept
{
	return lhs.major() < rhs.major() or (lhs.major() == rhs.major() and lhs.minor_ <= rhs.minor_);
}
inline constexpr bool operator >(const compute_capability_t& lhs, const compute_capability_t& rhs) noexcept
{
	return lhs.major() > rhs.major() or (lhs.major() == rhs.major() and lhs.minor_ > rhs.minor_);
}
inline constexpr bool operator >=(const compute_capability_t& lhs, const compute_capability_t& rhs) noexcept
{
	return lhs.major() > rhs.major() or (lhs.major() == rhs.major() and lhs.minor_ >= rhs.minor_);
}

namespace detail_ {

inline constexpr const char* architecture_name(const compute_architecture_t& arch)
{
	return
		(arch.major ==  1) ? "Tesla" :
		(arch.major ==  2) ? "Fermi" :
		(arch.major ==  3) ? "Kepler" :
			// Note: No architecture number 4!
		(arch.major ==  5) ? "Maxwell" :
		(arch.major ==  6) ? "Pascal" :
		(arch.major ==  7) ? "Volta/Turing" :
		(arch.major ==  8) ? "Ampere/Lovelace" :
		(arch.major ==  9) ? "Hopper" :
		(arch.major == 10) ? "Blackwell" :
			// Note: No architecture number 11!
		(arch.major == 12) ? "Blackwell" :
		nullptr;
}

} // namespace detail_

inline const char* compute_architecture_t::name() const {
	auto name_ = detail_::architecture_name(*this);
	if (name_ == nullptr) {
		throw ::std::invalid_argument("No known architecture numbered " + ::std::to_string(major));
	}
	return name_;
}

///@endcond

/**
 * @brief The exclusivity settings of a device, which determine how many
 * processes (or contexts) may use it at once.
 *
 * @note MPS daemons are typically run on devices in the exclusive-process mode,
 * so that only the MPS server itself holds a context on them.
 */
enum class compute_mode_t : int {
	shared            = 0, ///< `CU_COMPUTEMODE_DEFAULT`
	prohibited        = 2, ///< `CU_COMPUTEMODE_PROHIBITED`
	exclusive_process = 3, ///< `CU_COMPUTEMODE_EXCLUSIVE_PROCESS`
};

inline const char* name(compute_mode_t mode)
{
	switch(mode) {
	case compute_mode_t::shared:            return "shared";
	case compute_mode_t::prohibited:        return "prohibited";
	case compute_mode_t::exclusive_process: return "exclusive-process";
	}
	return "unknown";
}

/**
 * @brief What the supervisor learns about a device before deciding whether an MPS
 * daemon may be started for it.
 */
struct properties_t {
	id_t id;
	::std::string name;
	compute_capability_t compute_capability;
	compute_mode_t compute_mode;
};

} // namespace device
} // namespace cudamps

#endif // CUDAMPS_DEVICE_PROPERTIES_HPP_
