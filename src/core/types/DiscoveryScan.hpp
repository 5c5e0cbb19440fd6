/**
 * @file DiscoveryScan.hpp
 * @brief State of one network sweep.
 */

#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace rackscan::core {

/**
 * @brief Lifecycle state of a discovery scan.
 *
 * Transitions only move forward: Pending -> Running -> Completed | Failed,
 * or Pending -> Failed.
 */
enum class ScanStatus : int {
    Pending = 0,   ///< Created, not yet started
    Running = 1,   ///< Hosts are being probed
    Completed = 2, ///< All hosts probed
    Failed = 3     ///< Aborted by a configuration error or cancellation
};

/**
 * @brief Depth label of a scan. The baseline engine probes identically for all of them.
 */
enum class ScanType : int {
    Quick = 0,
    Full = 1,
    Deep = 2
};

/**
 * @brief Converts a ScanType to its lowercase name.
 * @param type The scan type.
 * @return "quick", "full" or "deep".
 */
std::string scanTypeToString(ScanType type);

/**
 * @brief Parses a scan type name.
 * @param str The name to parse.
 * @return The matching ScanType, Full if not recognized.
 */
ScanType scanTypeFromString(const std::string& str);

/**
 * @brief One execution of a subnet sweep with its progress counters.
 */
struct DiscoveryScan {
    std::string id;                           ///< Unique identifier
    std::string networkId;                    ///< Network being scanned
    ScanStatus status{ScanStatus::Pending};   ///< Lifecycle state
    ScanType scanType{ScanType::Full};        ///< Depth label
    int scanDepth{2};                         ///< Probe depth (always 2 for TCP discovery)
    int totalHosts{0};                        ///< Candidate hosts after exclusions
    int scannedHosts{0};                      ///< Hosts probed so far
    int foundHosts{0};                        ///< Hosts found online so far
    std::optional<std::chrono::system_clock::time_point> startedAt;   ///< When probing began
    std::optional<std::chrono::system_clock::time_point> completedAt; ///< When the scan ended
    int durationSeconds{0};                   ///< Wall time between start and end
    std::string errorMessage;                 ///< Reason for failure
    std::chrono::system_clock::time_point createdAt; ///< Record creation time
    std::chrono::system_clock::time_point updatedAt; ///< Record update time

    /**
     * @brief Percentage of candidate hosts probed.
     * @return scanned / total * 100, or 0 when there are no candidates.
     */
    [[nodiscard]] double progressPercent() const {
        return totalHosts > 0 ? (static_cast<double>(scannedHosts) / totalHosts) * 100.0 : 0.0;
    }

    /**
     * @brief Checks whether the scan has reached a final state.
     * @return True for Completed or Failed.
     */
    [[nodiscard]] bool isTerminal() const {
        return status == ScanStatus::Completed || status == ScanStatus::Failed;
    }

    /**
     * @brief Moves the scan to a new status.
     *
     * Setting the current status again is a no-op.
     *
     * @param next Requested status.
     * @throws DiscoveryError with InvalidRequest for a backward transition
     *         or any change out of a terminal state.
     */
    void advanceTo(ScanStatus next);

    /**
     * @brief Converts this scan's status to a string.
     * @return "pending", "running", "completed" or "failed".
     */
    [[nodiscard]] std::string statusToString() const;

    /**
     * @brief Converts a ScanStatus enum to a string.
     * @param status The status to convert.
     * @return String representation of the status.
     */
    static std::string scanStatusToString(ScanStatus status);

    /**
     * @brief Parses a string to get the corresponding ScanStatus.
     * @param str The string to parse.
     * @return The matching status, Pending if not recognized.
     */
    static ScanStatus statusFromString(const std::string& str);
};

} // namespace rackscan::core
