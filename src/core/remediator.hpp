// core/remediator.hpp - NTFS volume check, repair and remount
#pragma once

#include "../conf/config.hpp"
#include "events.hpp"
#include "fstab.hpp"
#include "health.hpp"
#include "runner.hpp"
#include <string>
#include <vector>

namespace ntfsmh {

enum class VolumeState {
  MissingDevice, // resolved path is not a block device
  NotNtfs,       // blkid reports another filesystem
  Healthy,       // mounted, no kernel log errors
  KernelErrors,  // mounted, kernel log reports errors
  NotMounted
};

const char *volume_state_name(VolumeState state);

struct EntryStatus {
  FstabEntry entry;
  std::string device;
  std::string fs_type;
  VolumeState state = VolumeState::MissingDevice;
  HealthReport health;

  bool is_candidate() const {
    return state != VolumeState::MissingDevice &&
           state != VolumeState::NotNtfs;
  }
  bool needs_repair() const {
    return state == VolumeState::KernelErrors ||
           state == VolumeState::NotMounted;
  }
};

enum class EntryOutcome {
  SkippedMissingDevice,
  SkippedNotNtfs,
  Healthy,
  RepairFailed,
  Remounted,
  MountFailed
};

const char *entry_outcome_name(EntryOutcome outcome);

struct EntryReport {
  EntryStatus status;
  EntryOutcome outcome = EntryOutcome::SkippedMissingDevice;
  bool repaired = false;

  bool counted() const { return status.is_candidate(); }
  bool problem_detected() const { return status.needs_repair(); }
};

struct RunSummary {
  int total_ntfs = 0;
  int fixed_count = 0;
  int error_count = 0;
  std::vector<EntryReport> entries;

  void add(const EntryReport &report);
};

class Remediator {
public:
  Remediator(const Config &config, CommandRunner &runner, EventSink &sink);

  // Read-only probe: resolve, verify type, check mount and kernel log.
  EntryStatus inspect(const FstabEntry &entry);

  EntryReport process_entry(const FstabEntry &entry);
  RunSummary process_entries(const std::vector<FstabEntry> &entries);

  // Full pass over the configured mount table, followed by mount -a,
  // the summary and the last-run marker.
  RunSummary run();

private:
  EntryReport repair_and_remount(const EntryStatus &status);
  void report(const RunSummary &summary);

  const Config &config_;
  CommandRunner &runner_;
  EventSink &sink_;
};

} // namespace ntfsmh
