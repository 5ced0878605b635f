#pragma once
/**
 * @file TrajectoryResult.h
 * @brief Possible outcomes of a simulated trajectory.
 */

/**
 * @brief Codes returned by TrajectorySimulator::run and passed to DataCollector::save.
 */
namespace ipsim {
    enum class TrajectoryResult: int { ABSORBED, CAPPED_AT_HORIZON, FAILED };
}
