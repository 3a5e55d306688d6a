/// @file Pm5Drive.cpp
/// @brief Command-line tool for PM5 monitor flash drives.
///
/// Usage:
///   pm5drive info <device>
///   pm5drive init <device> [<username>] [--force] [--user-id N]
///                 [--hw-revision N] [--yes]
///   pm5drive list <device> [-n <num>]
///   pm5drive export <device> [<entry-id> | last] [<out-file>]
///   pm5drive flash <device> <firmware-image> [--yes]
///   pm5drive clear-firmware <device> [--yes]
///   pm5drive pack-firmware <payload> <out-file> <major> <minor>
///                          <hw-revision> [<text>]
///
/// <device> is a block device or an image file. Commands that overwrite data
/// ask for confirmation unless --yes is given. Exits 0 on success, 1 on any
/// failure.

#include <algorithm>
#include <charconv>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <format>
#include <iostream>
#include <optional>
#include <print>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "DriveOperations.h"
#include "FirmwareImage.h"
#include "WorkoutRecord.h"

using namespace pm5Drive;

namespace {

struct Arguments {
  std::vector<std::string> positional;
  bool force = false;
  bool yes = false;
  std::optional<uint32_t> userId;
  std::optional<uint32_t> hardwareRevision;
  std::optional<uint32_t> count;
};

std::optional<uint32_t> parseNumber(std::string_view text) {
  uint32_t value = 0;
  auto [end, error] = std::from_chars(text.data(), text.data() + text.size(),
                                      value);
  if (error != std::errc{} || end != text.data() + text.size()) {
    return std::nullopt;
  }
  return value;
}

std::optional<Arguments> parseArguments(int argc, char* argv[]) {
  Arguments args;
  for (int i = 2; i < argc; i++) {
    const std::string_view arg = argv[i];
    std::optional<uint32_t>* numeric = nullptr;
    if (arg == "--force") {
      args.force = true;
    } else if (arg == "--yes" || arg == "-y") {
      args.yes = true;
    } else if (arg == "--user-id") {
      numeric = &args.userId;
    } else if (arg == "--hw-revision") {
      numeric = &args.hardwareRevision;
    } else if (arg == "-n") {
      numeric = &args.count;
    } else if (arg.starts_with("-") && arg.size() > 1) {
      std::println(stderr, "Error: Unknown option '{}'", arg);
      return std::nullopt;
    } else {
      args.positional.emplace_back(arg);
    }

    if (numeric != nullptr) {
      if (i + 1 >= argc || !(*numeric = parseNumber(argv[i + 1]))) {
        std::println(stderr, "Error: {} needs a number", arg);
        return std::nullopt;
      }
      i++;
    }
  }
  return args;
}

bool confirm(std::string_view message) {
  std::print("{} (y/N): ", message);
  std::fflush(stdout);
  std::string line;
  if (!std::getline(std::cin, line)) {
    return false;
  }
  return line == "y" || line == "Y";
}

std::string defaultUserName() {
  for (const char* variable : {"SUDO_USER", "USER"}) {
    if (const char* value = std::getenv(variable); value && *value) {
      return value;
    }
  }
  return {};
}

std::string formatDate(std::chrono::sys_seconds time) {
  return std::format("{:%Y-%m-%d %H:%M}", time);
}

struct IntervalDescriber {
  std::string operator()(const TimeInterval& i) const {
    return std::format("time     target {:>9}  {}", formatTenths(i.targetTenths),
                       result(i.result));
  }
  std::string operator()(const DistanceInterval& i) const {
    return std::format("distance target {:>7} m  {}", i.targetMeters,
                       result(i.result));
  }
  std::string operator()(const CalorieInterval& i) const {
    return std::format("calorie  target {:>5} cal  {}", i.targetCalories,
                       result(i.result));
  }
  std::string operator()(const RestInterval& i) const {
    return std::format("rest     {:>9}  HR {}", formatTenths(i.durationTenths),
                       i.heartRate);
  }
  std::string operator()(const RawInterval& i) const {
    return std::format("unknown  kind 0x{:02X} ({} bytes)", i.kindTag,
                       i.bytes.size());
  }

  static std::string result(const IntervalResult& r) {
    return std::format("{:>9} {:>6} m  {:>7}/500m  {:>3} spm  {:>3} bpm  {} W",
                       formatTenths(r.durationTenths), r.distanceMeters,
                       formatTenths(r.paceTenths), r.strokeRate, r.heartRate,
                       r.watts);
  }
};

void printEntryRow(size_t index, const WorkoutLogEntry& entry) {
  const auto heartRate = averageHeartRate(entry);
  const double power = watts(entry);
  std::println(
      "{:>3} {:16} {:17} {:>6} {:>9} {:>9} {:>3} {:>7} {:>3} {:>4.0f} {:>6.0f}",
      index, formatDate(entry.startTime), toString(entry.type),
      entry.totalDistanceMeters, formatTenths(entry.totalDurationTenths),
      formatTenths(entry.restDurationTenths),
      entry.summary.strokeRate == 0 ? std::string{}
                                    : std::to_string(entry.summary.strokeRate),
      formatTenths(paceTenths(entry)),
      heartRate ? std::to_string(*heartRate) : std::string{}, power,
      caloriesPerHour(power));
}

// -----------------------------------------------------------------------------
// Commands
// -----------------------------------------------------------------------------

int cmdInfo(const Arguments& args) {
  if (args.positional.size() != 1) {
    std::println(stderr, "Usage: pm5drive info <device>");
    return 1;
  }

  auto info = driveInfo(args.positional[0]);
  if (!info) {
    std::println(stderr, "Error: {}", info.error().describe());
    return 1;
  }

  const DriveSummary& summary = info->summary;
  std::println("{:<24}0x{:X} ({} bytes, type 0x{:02X})", "Partition:",
               info->partitionOrigin, info->partitionSize, info->partitionType);
  std::println("{:<24}{}", "User Name:", summary.user.name);
  std::println("{:<24}{}", "User ID:", summary.user.id);
  std::println("{:<24}{}", "Hardware Revision:", summary.hardwareRevision);
  std::println("{:<24}{}", "Initialized:", formatDate(info->metadata.createdAt));
  std::println("{:<24}{}", "Workouts:", summary.entryCount);
  if (summary.corruptCount > 0) {
    std::println("{:<24}{}", "Corrupt Slots:", summary.corruptCount);
  }
  std::println("{:<24}{}", "Lifetime Meters:", summary.lifetimeMeters);
  std::println("{:<24}{:.3f}", "Lifetime kWh:", summary.lifetimeKwh);
  std::println("{:<24}{:.0f}", "Lifetime kcal:", summary.lifetimeKcal);
  if (summary.firstWorkout && summary.lastWorkout) {
    std::println("{:<24}{}", "First Workout:", formatDate(*summary.firstWorkout));
    std::println("{:<24}{}", "Last Workout:", formatDate(*summary.lastWorkout));
  }

  if (info->firmware) {
    const FirmwareInfo& fw = *info->firmware;
    std::println("{:<24}{} {}.{:03} (hw {}){}", "Installed Firmware:",
                 fw.versionText, fw.versionMajor, fw.versionMinor,
                 fw.hardwareRevision, fw.beta ? " beta" : "");
  } else if (info->firmwareError) {
    std::println("{:<24}invalid ({})", "Installed Firmware:",
                 toString(*info->firmwareError));
  } else {
    std::println("{:<24}none", "Installed Firmware:");
  }
  return 0;
}

int cmdInit(const Arguments& args) {
  if (args.positional.empty() || args.positional.size() > 2) {
    std::println(stderr,
                 "Usage: pm5drive init <device> [<username>] [--force] "
                 "[--user-id N] [--hw-revision N] [--yes]");
    return 1;
  }

  if (args.userId.value_or(0) > 0xFFFF ||
      args.hardwareRevision.value_or(0) > 0xFFFF) {
    std::println(stderr,
                 "Error: --user-id and --hw-revision must be at most 65535");
    return 1;
  }

  const std::string& device = args.positional[0];
  InitOptions options{
      .user = {.name = args.positional.size() == 2 ? args.positional[1]
                                                   : defaultUserName(),
               .id = static_cast<uint16_t>(args.userId.value_or(0))},
      .hardwareRevision =
          static_cast<uint16_t>(args.hardwareRevision.value_or(0)),
      .force = args.force,
  };

  if (!args.yes) {
    std::println("About to write the PM5 layout to {}{}!", device,
                 args.force ? ", erasing all workout history" : "");
    if (!confirm("Proceed?")) {
      std::println("Aborted.");
      return 1;
    }
  }

  auto layout = initDrive(device, options);
  if (!layout) {
    std::println(stderr, "Error: {}", layout.error().describe());
    if (layout.error().error == InitError::AlreadyInitialized) {
      std::println(stderr, "Use --force to overwrite the existing drive.");
    }
    return 1;
  }

  std::println("[Pm5Drive] Drive initialized: {} slots, firmware slot at 0x{:X}",
               layout->slotCount, layout->firmwareSlot.offset);
  return 0;
}

int cmdList(const Arguments& args) {
  if (args.positional.size() != 1) {
    std::println(stderr, "Usage: pm5drive list <device> [-n <num>]");
    return 1;
  }

  auto items = listDrive(args.positional[0]);
  if (!items) {
    std::println(stderr, "Error: {}", items.error().describe());
    return 1;
  }

  std::println(
      "{:>3} {:16} {:17} {:>6} {:>9} {:>9} {:>3} {:>7} {:>3} {:>4} {:>6}", "#",
      "Date", "Type", "Dist.", "Work Time", "Rest Time", "SPM", "Pace", "HR",
      "W", "kcal/h");
  std::println("{}", std::string(90, '='));

  const size_t count = items->size();
  const size_t shown = args.count ? std::min<size_t>(*args.count, count) : count;
  for (size_t i = count - shown; i < count; i++) {
    const ScanItem& item = (*items)[i];
    if (item.entry) {
      printEntryRow(i + 1, *item.entry);
    } else {
      std::println("{:>3} slot {} is corrupt: {}", i + 1, item.slot,
                   toString(item.entry.error().reason));
    }
  }
  return 0;
}

int cmdExport(const Arguments& args) {
  if (args.positional.empty() || args.positional.size() > 3) {
    std::println(stderr,
                 "Usage: pm5drive export <device> [<entry-id> | last] "
                 "[<out-file>]");
    return 1;
  }

  // No id, or "last", picks the newest workout.
  std::optional<uint16_t> entryId;
  if (args.positional.size() >= 2 && args.positional[1] != "last") {
    auto parsed = parseNumber(args.positional[1]);
    if (!parsed || *parsed > 0xFFFF) {
      std::println(stderr, "Error: Invalid entry id '{}'", args.positional[1]);
      return 1;
    }
    entryId = static_cast<uint16_t>(*parsed);
  }

  auto stored = exportEntry(args.positional[0], entryId);
  if (!stored) {
    std::println(stderr, "Error: {}", stored.error().describe());
    return 1;
  }

  const WorkoutLogEntry& entry = stored->entry;
  std::println("{:<16}{}", "Entry:", entry.entryId);
  std::println("{:<16}{}", "Slot:", stored->slot);
  std::println("{:<16}{}", "Format:", entry.formatVersion);
  std::println("{:<16}{}", "Date:", formatDate(entry.startTime));
  std::println("{:<16}{}", "Type:", toString(entry.type));
  if (!entry.name.empty()) {
    std::println("{:<16}{}", "Name:", entry.name);
  }
  std::println("{:<16}{}", "Serial:", entry.serialNumber);
  std::println("{:<16}{} m", "Distance:", entry.totalDistanceMeters);
  std::println("{:<16}{}", "Work Time:", formatTenths(entry.totalDurationTenths));
  std::println("{:<16}{}", "Rest Time:", formatTenths(entry.restDurationTenths));
  std::println("{:<16}{}/500m", "Pace:", formatTenths(paceTenths(entry)));
  std::println("{:<16}{}", "Calories:", entry.summary.calories);
  if (entry.summary.dragFactor != 0) {
    std::println("{:<16}{}", "Drag Factor:", entry.summary.dragFactor);
  }
  for (size_t i = 0; i < entry.intervals.size(); i++) {
    std::println("  {:>2}. {}", i + 1,
                 std::visit(IntervalDescriber{}, entry.intervals[i]));
  }

  if (args.positional.size() == 3) {
    if (auto written = writeFile(args.positional[2], stored->raw); !written) {
      std::println(stderr, "Error: Failed to write '{}': {}",
                   args.positional[2], toString(written.error()));
      return 1;
    }
    std::println("[Pm5Drive] Wrote {} bytes to {}", stored->raw.size(),
                 args.positional[2]);
  }
  return 0;
}

int cmdFlash(const Arguments& args) {
  if (args.positional.size() != 2) {
    std::println(stderr,
                 "Usage: pm5drive flash <device> <firmware-image> [--yes]");
    return 1;
  }
  const std::string& device = args.positional[0];
  const std::string& imagePath = args.positional[1];

  bool confirmed = args.yes;
  if (!confirmed) {
    std::println("About to overwrite the firmware slot on {} with {}.", device,
                 imagePath);
    std::println("A failed or interrupted write can leave the monitor unusable.");
    confirmed = confirm("Proceed?");
  }
  if (!confirmed) {
    std::println("Aborted.");
    return 1;
  }

  auto progress = [](FlashPhase phase, uint64_t done, uint64_t total) {
    if (done == total) {
      std::println("[Pm5Drive] {} done ({} bytes)", toString(phase), total);
    }
  };

  auto flashed = flashDrive(device, imagePath, confirmed, progress);
  if (!flashed) {
    std::println(stderr, "Error: {}", flashed.error().describe());
    return 1;
  }

  std::println("[Pm5Drive] Firmware {} {}.{:03} written ({} bytes, CRC-32 0x{:08X})",
               flashed->firmware.versionText, flashed->firmware.versionMajor,
               flashed->firmware.versionMinor, flashed->length, flashed->crc);
  return 0;
}

int cmdClearFirmware(const Arguments& args) {
  if (args.positional.size() != 1) {
    std::println(stderr, "Usage: pm5drive clear-firmware <device> [--yes]");
    return 1;
  }
  const std::string& device = args.positional[0];

  bool confirmed = args.yes;
  if (!confirmed) {
    std::println("About to erase the firmware slot on {}.", device);
    confirmed = confirm("Proceed?");
  }
  if (!confirmed) {
    std::println("Aborted.");
    return 1;
  }

  if (auto cleared = clearDriveFirmware(device, confirmed); !cleared) {
    std::println(stderr, "Error: {}", cleared.error().describe());
    return 1;
  }
  std::println("[Pm5Drive] Firmware slot erased.");
  return 0;
}

int cmdPackFirmware(const Arguments& args) {
  if (args.positional.size() < 5 || args.positional.size() > 6) {
    std::println(stderr,
                 "Usage: pm5drive pack-firmware <payload> <out-file> <major> "
                 "<minor> <hw-revision> [<text>]");
    return 1;
  }

  auto major = parseNumber(args.positional[2]);
  auto minor = parseNumber(args.positional[3]);
  auto revision = parseNumber(args.positional[4]);
  if (!major || !minor || !revision || *major > 0xFFFF || *minor > 0xFFFF ||
      *revision > 0xFFFF) {
    std::println(stderr, "Error: Version and revision must be 0 to 65535");
    return 1;
  }

  auto payload = readFile(args.positional[0]);
  if (!payload) {
    std::println(stderr, "Error: Failed to read '{}': {}", args.positional[0],
                 toString(payload.error()));
    return 1;
  }

  const FirmwareInfo info{
      .versionMajor = static_cast<uint16_t>(*major),
      .versionMinor = static_cast<uint16_t>(*minor),
      .hardwareRevision = static_cast<uint16_t>(*revision),
      .beta = false,
      .versionText = args.positional.size() == 6 ? args.positional[5] : "",
      .buildTime = std::chrono::floor<std::chrono::seconds>(
          std::chrono::system_clock::now()),
  };

  auto image = FirmwareImage::package(info, *payload);
  if (!image) {
    std::println(stderr, "Error: Cannot package firmware: {}",
                 toString(image.error()));
    return 1;
  }
  if (auto written = writeFile(args.positional[1], *image); !written) {
    std::println(stderr, "Error: Failed to write '{}': {}", args.positional[1],
                 toString(written.error()));
    return 1;
  }

  std::println("[Pm5Drive] Packed {} byte image for hardware revision {}",
               image->size(), *revision);
  return 0;
}

void printUsage() {
  std::println(stderr, "Usage: pm5drive <command> [arguments]");
  std::println(stderr, "Commands: info, init, list, export, flash, "
                       "clear-firmware, pack-firmware");
}

}  // namespace

int main(int argc, char* argv[]) {
  if (argc < 2) {
    printUsage();
    return 1;
  }

  struct Command {
    const char* name;
    int (*run)(const Arguments&);
  };

  const Command commands[] = {
      {"info", &cmdInfo},
      {"init", &cmdInit},
      {"list", &cmdList},
      {"export", &cmdExport},
      {"flash", &cmdFlash},
      {"clear-firmware", &cmdClearFirmware},
      {"pack-firmware", &cmdPackFirmware},
  };

  const std::string_view name = argv[1];
  for (const auto& command : commands) {
    if (name != command.name) {
      continue;
    }
    auto args = parseArguments(argc, argv);
    if (!args) {
      return 1;
    }
    return command.run(*args);
  }

  std::println(stderr, "Error: Unknown command '{}'", name);
  printUsage();
  return 1;
}
