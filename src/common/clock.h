#pragma once

#include <chrono>

namespace SalKafka {

/**
 * Wall-clock time in seconds since the Unix epoch. Used for the
 * private_sndStamp / private_rcvStamp fields so that stamps taken by
 * different processes on one host are comparable.
 */
inline double UnixTimeSeconds() {
	return std::chrono::duration<double>(
			std::chrono::system_clock::now().time_since_epoch()).count();
}

inline double SecondsSince(std::chrono::steady_clock::time_point start) {
	return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
}

} // namespace SalKafka
