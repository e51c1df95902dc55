#include "elfpeek/error.hpp"
#include "elfpeek/layout.hpp"
#include "elfpeek/report.hpp"
#include "sample_headers.hpp"
#include <algorithm>
#include <cstdlib>
#include <fmt/format.h>
#include <gtest/gtest.h>
#include <map>
#include <sysexits.h>

using namespace elfpeek;

namespace {

struct fake_files {
  std::map<std::string, std::vector<uint8_t>> files;
  std::vector<std::string> requested;

  loader as_loader() {
    return [this](std::string const &path) {
      requested.push_back(path);
      auto it = files.find(path);
      if (it == files.end())
        throw io_error(fmt::format("failed to open {}: No such file", path));
      return it->second;
    };
  }
};

fake_files three_files() {
  auto corrupted = samples::x86_64_exec();
  corrupted[0] = 0x00;
  return {.files = {{"a.out", samples::x86_64_exec()},
                    {"arm.elf", samples::arm_exec()},
                    {"notes.txt", corrupted}}};
}

} // namespace

TEST(Inspect, RecordsOneOutcomePerFileInOrder) {
  auto fs = three_files();
  std::vector<std::string> paths = {"a.out", "notes.txt", "missing.o",
                                    "arm.elf"};
  auto outcomes = inspect_all(paths, fs.as_loader());

  EXPECT_EQ(fs.requested, paths);
  ASSERT_EQ(outcomes.size(), 4u);
  EXPECT_EQ(outcomes[0].path, "a.out");
  ASSERT_NE(outcomes[0].decoded(), nullptr);
  EXPECT_EQ(outcomes[0].decoded()->machine, amd64);

  ASSERT_NE(outcomes[1].error(), nullptr);
  EXPECT_EQ(outcomes[1].error()->kind, failure::not_elf);

  ASSERT_NE(outcomes[2].error(), nullptr);
  EXPECT_EQ(outcomes[2].error()->kind, failure::unreadable);
  EXPECT_EQ(outcomes[2].error()->message,
            "failed to open missing.o: No such file");

  ASSERT_NE(outcomes[3].decoded(), nullptr);
  EXPECT_EQ(outcomes[3].decoded()->format, e32);
}

TEST(Inspect, TruncatedFileDoesNotStopTheBatch) {
  auto fs = three_files();
  fs.files["short.o"] = samples::x86_64_exec();
  fs.files["short.o"].resize(20);
  std::vector<std::string> paths = {"short.o", "a.out"};
  auto outcomes = inspect_all(paths, fs.as_loader());

  ASSERT_NE(outcomes[0].error(), nullptr);
  EXPECT_EQ(outcomes[0].error()->kind, failure::truncated);
  EXPECT_NE(outcomes[0].error()->message.find("e_version"), std::string::npos);
  EXPECT_NE(outcomes[1].decoded(), nullptr);
}

TEST(Tabulate, OneColumnPerDecodedFile) {
  auto fs = three_files();
  std::vector<std::string> paths = {"a.out", "notes.txt", "arm.elf"};
  auto outcomes = inspect_all(paths, fs.as_loader());
  auto table = tabulate(outcomes);

  ASSERT_EQ(table.files.size(), 2u);
  EXPECT_EQ(table.files[0], "a.out");
  EXPECT_EQ(table.files[1], "arm.elf");
  EXPECT_EQ(table.rows.size(), 18u);
  for (auto const &r : table.rows) {
    EXPECT_EQ(r.cells.size(), 2u) << r.label;
  }

  auto const &arch = table.at("Architecture");
  EXPECT_EQ(arch.display, style::label);
  EXPECT_EQ(arch.cells[0], value("64bit architecture"));
  EXPECT_EQ(arch.cells[1], value("32bit architecture"));
  EXPECT_EQ(table.at("Machine Type").cells[1], value("ARM"));
  EXPECT_EQ(table.at("Entry Point").cells[0], value(u64{0x401040}));
  EXPECT_THROW(table.at("Program Headers"), std::out_of_range);
}

TEST(Tabulate, UnknownMachineLeavesAnEmptySlot) {
  auto fs = three_files();
  fs.files["odd.o"] = samples::x86_64_exec();
  fs.files["odd.o"][18] = 0xff;
  fs.files["odd.o"][19] = 0xff;
  std::vector<std::string> paths = {"odd.o", "a.out"};
  auto outcomes = inspect_all(paths, fs.as_loader());
  auto table = tabulate(outcomes);

  auto const &machine = table.at("Machine Type");
  ASSERT_EQ(machine.cells.size(), 2u);
  EXPECT_FALSE(machine.cells[0].has_value());
  EXPECT_EQ(machine.cells[1], value("AMD64"));
}

TEST(Render, FormatsCellsByStyle) {
  EXPECT_EQ(format_cell(style::hex, u64{0x401040}), "0x401040");
  EXPECT_EQ(format_cell(style::hex, u64{0}), "0x0");
  EXPECT_EQ(format_cell(style::bytes, u64{64}), "64 bytes");
  EXPECT_EQ(format_cell(style::decimal, u64{13}), "13");
  EXPECT_EQ(format_cell(style::label, std::string_view("AMD64")), "AMD64");
}

TEST(Render, TableWithRejectedFile) {
  auto fs = three_files();
  std::vector<std::string> paths = {"a.out", "arm.elf", "notes.txt"};
  auto out = render_to_string(inspect_all(paths, fs.as_loader()));

  EXPECT_NE(out.find("notes.txt is not an ELF file\n"), std::string::npos);
  EXPECT_EQ(out.find("notes.txt", out.find('\n') + 1), std::string::npos);

  auto title = fmt::format("{:^53}{:^30}{:^30}\n", "File", "a.out", "arm.elf");
  EXPECT_NE(out.find(title), std::string::npos) << out;

  auto line = [](std::string_view label, std::string_view a,
                std::string_view b) {
    return fmt::format("{:<50} = {:<30}{:<30}\n", label, a, b);
  };
  EXPECT_NE(out.find(line("Architecture", "64bit architecture",
                         "32bit architecture")),
            std::string::npos)
      << out;
  EXPECT_NE(out.find(line("File Type", "Executable file", "Executable file")),
            std::string::npos);
  EXPECT_NE(out.find(line("Entry Point", "0x401040", "0x102d5")),
            std::string::npos);
  EXPECT_NE(out.find(line("Header's Size", "64 bytes", "52 bytes")),
            std::string::npos);
  EXPECT_NE(out.find(line("Section Header's Number", "31", "29")),
            std::string::npos);
}

TEST(Render, OnlyRejectionsWhenNothingDecodes) {
  auto fs = three_files();
  std::vector<std::string> paths = {"notes.txt", "missing.o"};
  auto out = render_to_string(inspect_all(paths, fs.as_loader()));
  EXPECT_EQ(out, "notes.txt is not an ELF file\n");
}

TEST(ExitStatus, TruncatedFileIsADataError) {
  auto fs = three_files();
  fs.files["short.o"] = samples::x86_64_exec();
  fs.files["short.o"].resize(40);
  std::vector<std::string> paths = {"a.out", "short.o"};
  EXPECT_EQ(exit_status(inspect_all(paths, fs.as_loader())), EX_DATAERR);
}

TEST(ExitStatus, UnreadableFileTakesPrecedence) {
  auto fs = three_files();
  fs.files["short.o"] = samples::x86_64_exec();
  fs.files["short.o"].resize(40);
  std::vector<std::string> paths = {"missing.o", "short.o"};
  EXPECT_EQ(exit_status(inspect_all(paths, fs.as_loader())), EX_NOINPUT);

  std::ranges::reverse(paths);
  EXPECT_EQ(exit_status(inspect_all(paths, fs.as_loader())), EX_NOINPUT);
}

TEST(ExitStatus, RejectedFilesAloneSucceed) {
  auto fs = three_files();
  std::vector<std::string> paths = {"notes.txt", "a.out", "arm.elf"};
  EXPECT_EQ(exit_status(inspect_all(paths, fs.as_loader())), EXIT_SUCCESS);
  EXPECT_EQ(exit_status({}), EXIT_SUCCESS);
}
