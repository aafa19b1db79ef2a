// core/remediator.cpp - NTFS volume check, repair and remount
#include "remediator.hpp"
#include "../mount/volume.hpp"
#include "../utils.hpp"
#include "device.hpp"
#include "state.hpp"

namespace ntfsmh {

const char *volume_state_name(VolumeState state) {
  switch (state) {
  case VolumeState::MissingDevice:
    return "missing-device";
  case VolumeState::NotNtfs:
    return "not-ntfs";
  case VolumeState::Healthy:
    return "healthy";
  case VolumeState::KernelErrors:
    return "kernel-errors";
  case VolumeState::NotMounted:
    return "not-mounted";
  }
  return "unknown";
}

const char *entry_outcome_name(EntryOutcome outcome) {
  switch (outcome) {
  case EntryOutcome::SkippedMissingDevice:
    return "skipped-missing-device";
  case EntryOutcome::SkippedNotNtfs:
    return "skipped-not-ntfs";
  case EntryOutcome::Healthy:
    return "healthy";
  case EntryOutcome::RepairFailed:
    return "repair-failed";
  case EntryOutcome::Remounted:
    return "remounted";
  case EntryOutcome::MountFailed:
    return "mount-failed";
  }
  return "unknown";
}

void RunSummary::add(const EntryReport &report) {
  if (report.counted())
    ++total_ntfs;
  if (report.problem_detected())
    ++error_count;
  if (report.repaired)
    ++fixed_count;
  entries.push_back(report);
}

Remediator::Remediator(const Config &config, CommandRunner &runner,
                       EventSink &sink)
    : config_(config), runner_(runner), sink_(sink) {}

EntryStatus Remediator::inspect(const FstabEntry &entry) {
  EntryStatus status;
  status.entry = entry;
  status.device = resolve_device(runner_, entry.device_spec);

  if (!is_block_device(runner_, status.device)) {
    status.state = VolumeState::MissingDevice;
    return status;
  }

  status.fs_type = detect_fs_type(runner_, status.device);
  if (!is_ntfs_type(status.fs_type)) {
    status.state = VolumeState::NotNtfs;
    return status;
  }

  if (!is_mounted(runner_, entry.mount_point)) {
    status.state = VolumeState::NotMounted;
    return status;
  }

  status.health =
      check_kernel_log(runner_, status.device, config_.dmesg_lines);
  status.state = status.health.errors_found() ? VolumeState::KernelErrors
                                              : VolumeState::Healthy;
  return status;
}

EntryReport Remediator::process_entry(const FstabEntry &entry) {
  EntryReport report;
  report.status = inspect(entry);
  const EntryStatus &status = report.status;

  switch (status.state) {
  case VolumeState::MissingDevice:
    sink_.warn("Device " + status.device + " not found, skipping...");
    report.outcome = EntryOutcome::SkippedMissingDevice;
    return report;

  case VolumeState::NotNtfs:
    sink_.info(status.device + " is not NTFS" +
               (status.fs_type.empty() ? "" : " (" + status.fs_type + ")") +
               ", skipping...");
    report.outcome = EntryOutcome::SkippedNotNtfs;
    return report;

  default:
    break;
  }

  sink_.info("Processing: " + status.device + " -> " + entry.mount_point);

  if (status.state == VolumeState::NotMounted) {
    sink_.warn("  Not mounted at " + entry.mount_point);
    return repair_and_remount(status);
  }

  sink_.info("  Mounted at " + entry.mount_point);
  if (!status.health.log_available) {
    sink_.warn("  Cannot read kernel log, assuming no errors");
  }

  if (status.state == VolumeState::Healthy) {
    sink_.info("  No kernel log errors, keeping mounted");
    report.outcome = EntryOutcome::Healthy;
    return report;
  }

  sink_.warn("  Kernel log reports problems for " + status.device);
  for (const auto &line : status.health.matches) {
    sink_.warn("    | " + line);
  }
  return repair_and_remount(status);
}

EntryReport Remediator::repair_and_remount(const EntryStatus &status) {
  EntryReport report;
  report.status = status;
  const FstabEntry &entry = status.entry;

  if (safe_unmount(runner_, sink_, entry.mount_point, config_.umount_settle)) {
    if (status.state == VolumeState::KernelErrors) {
      sink_.info("  Unmounted for repair");
    }
  }

  sink_.info("  Applying " + config_.repair_command + " to " + status.device +
             "...");
  std::vector<std::string> args = config_.repair_args;
  args.push_back(status.device);
  CommandResult res = runner_.run(config_.repair_command, args);
  sink_.output(res.output);

  if (!res.ok()) {
    sink_.error("  " + config_.repair_command + " failed on " + status.device +
                " (exit " + std::to_string(res.exit_code) + ")");
    report.outcome = EntryOutcome::RepairFailed;
    return report;
  }

  sink_.info("  " + config_.repair_command + " succeeded");
  report.repaired = true;

  sleep_seconds(config_.repair_settle);

  report.outcome = remount_entry(runner_, sink_, entry, status.device)
                       ? EntryOutcome::Remounted
                       : EntryOutcome::MountFailed;
  return report;
}

RunSummary Remediator::process_entries(const std::vector<FstabEntry> &entries) {
  RunSummary summary;
  for (const auto &entry : entries) {
    summary.add(process_entry(entry));
  }
  return summary;
}

void Remediator::report(const RunSummary &summary) {
  sink_.info("=== Final report ===");
  sink_.info("NTFS volumes in mount table: " +
             std::to_string(summary.total_ntfs));
  sink_.info("Volumes with problems: " + std::to_string(summary.error_count));
  sink_.info("Volumes repaired: " + std::to_string(summary.fixed_count));
  sink_.info("=== Check finished ===");
}

RunSummary Remediator::run() {
  sink_.info("=== Starting NTFS volume check ===");

  // Let systemd finish its own mounts first
  sleep_seconds(config_.startup_delay);

  std::vector<FstabEntry> entries = select_ntfs(load_fstab(config_.fstab));
  sink_.debug("Found " + std::to_string(entries.size()) +
              " NTFS entries in " + config_.fstab.string());

  RunSummary summary = process_entries(entries);

  mount_all(runner_, sink_);
  report(summary);

  if (!LastRunMarker::now().save(config_.lastrun_file)) {
    sink_.error("Could not update last-run marker " +
                config_.lastrun_file.string());
  }

  return summary;
}

} // namespace ntfsmh
