#include <gtest/gtest.h>

#include "chunk_naming.hpp"
#include "shell.hpp"
#include "split_file.hpp"
#include "test_helpers.hpp"

#include <cstdlib>
#include <filesystem>
#include <sstream>
#include <string>

namespace fs = std::filesystem;
using namespace std::literals;

namespace {

bool contains(const std::string& text, const std::string& what)
{
   return text.find(what) != text.npos;
}

// root/alpha (plain directory) and root/backup (chunks of notes.txt)
void make_tree(const test::Temp_directory& temp)
{
   fs::create_directories(temp / "root" / "alpha");

   const auto source = temp / "notes.txt";
   test::write_file(source, "first part|second part"s);

   split_file(source, temp.path() / "root" / "backup", Split_options{.chunk_size = 8});
}
}

TEST(Shell, ExitFromTopLevelMenu)
{
   std::istringstream in{"1\n"s};
   std::ostringstream out;

   EXPECT_EQ(run_interactive_shell(fs::temp_directory_path(), in, out, false), EXIT_SUCCESS);
   EXPECT_TRUE(contains(out.str(), "Reconstruct or split file:\n"s));
}

TEST(Shell, EndOfInputAtTopLevelExits)
{
   std::istringstream in{""s};
   std::ostringstream out;

   EXPECT_EQ(run_interactive_shell(fs::temp_directory_path(), in, out, false), EXIT_SUCCESS);
}

TEST(Shell, SplitFlowSplitsFile)
{
   test::Temp_directory temp{"chunk_split_shell_split"};
   const auto source = temp / "movie.mkv";
   test::write_file(source, test::make_pattern_bytes(100, 9));
   const auto target = temp / "out";

   std::istringstream in{"3\n"s + source.string() + "\n  "s + target.string() + "  \n"s};
   std::ostringstream out;

   EXPECT_EQ(run_interactive_shell(temp.path(), in, out, false), EXIT_SUCCESS);

   const auto text = out.str();

   EXPECT_TRUE(contains(text, "Enter the path to the file to split\n>>> "s));
   EXPECT_TRUE(contains(text, "Give a directory to save the chunks\n>>> "s));
   EXPECT_TRUE(contains(text, "File split successfully.\n"s));
   EXPECT_TRUE(fs::exists(target / chunk_file_name(0)));
   EXPECT_TRUE(fs::exists(target / metadata_file_name));
}

TEST(Shell, SplitFlowMissingSourceFails)
{
   test::Temp_directory temp{"chunk_split_shell_missing"};

   std::istringstream in{(temp / "nothing.bin").string() + "\n"s};
   std::ostringstream out;

   EXPECT_EQ(run_split_flow(in, out, Split_options{}), EXIT_FAILURE);
   EXPECT_TRUE(contains(out.str(), "File does not exist.\n"s));
   EXPECT_FALSE(contains(out.str(), "Give a directory"s));
}

TEST(Shell, SplitFlowPopulatedDirectoryFails)
{
   test::Temp_directory temp{"chunk_split_shell_populated"};
   const auto source = temp / "data.bin";
   test::write_file(source, test::make_pattern_bytes(10, 10));
   fs::create_directories(temp / "out");
   test::write_file(temp / "out" / "keep.txt", "k"s);

   std::istringstream in{source.string() + "\n"s + (temp / "out").string() + "\n"s};
   std::ostringstream out;

   EXPECT_EQ(run_split_flow(in, out, Split_options{}), EXIT_FAILURE);
   EXPECT_TRUE(contains(out.str(), "Error during splitting: "s));
}

TEST(Shell, NavigationEntriesTagChunkSets)
{
   test::Temp_directory temp{"chunk_split_shell_entries"};
   make_tree(temp);

   const auto entries = list_navigation_entries(temp / "root");

   ASSERT_EQ(entries.size(), 3u);
   EXPECT_EQ(entries[0].entry.label, "..");
   EXPECT_EQ(entries[0].target.string(), (temp / "root").parent_path().string());
   EXPECT_EQ(entries[1].entry.label, "alpha");
   EXPECT_EQ(entries[1].entry.kind, Entry_kind::directory);
   EXPECT_EQ(entries[2].entry.label, "backup");
   EXPECT_EQ(entries[2].entry.kind, Entry_kind::chunk_set);
}

TEST(Shell, RootDirectoryHasNoParentEntry)
{
   EXPECT_FALSE(parent_navigation_entry(fs::path{"/"}).has_value());

   const auto parent = parent_navigation_entry(fs::path{"/srv/chunks"});

   ASSERT_TRUE(parent.has_value());
   EXPECT_EQ(parent->entry.label, "..");
   EXPECT_EQ(parent->entry.kind, Entry_kind::directory);
   EXPECT_EQ(parent->target.string(), "/srv");
}

TEST(Shell, ReconstructFlowNavigatesAndReconstructs)
{
   test::Temp_directory temp{"chunk_split_shell_reconstruct"};
   make_tree(temp);

   // top menu: Reconstruct file, then "backup", then Reconstruct
   std::istringstream in{"2\n3\n2\n"s};
   std::ostringstream out;

   EXPECT_EQ(run_interactive_shell(temp / "root", in, out, false), EXIT_SUCCESS);

   const auto text = out.str();

   EXPECT_TRUE(contains(text, "\n>>>\t"s + (temp / "root").string() + "\n"s));
   EXPECT_TRUE(contains(text, "\tNo chunk files found in this directory.\n"s));
   EXPECT_TRUE(contains(text, "\tFound 3 chunk files in this directory.\n"s));
   EXPECT_TRUE(contains(text, "Reconstructed file saved as \"notes.txt\".\n"s));

   const auto bytes = test::read_file(temp / "root" / "backup" / "notes.txt");
   EXPECT_EQ(std::string(bytes.begin(), bytes.end()), "first part|second part");
}

TEST(Shell, ReconstructFlowCanGoUp)
{
   test::Temp_directory temp{"chunk_split_shell_up"};
   make_tree(temp);

   // into "alpha", back up with "..", then Exit (last of 5 entries)
   std::istringstream in{"2\n1\n5\n"s};
   std::ostringstream out;

   EXPECT_EQ(run_reconstruct_flow(temp / "root", in, out, Reconstruct_options{}),
             EXIT_SUCCESS);

   const auto text = out.str();

   EXPECT_TRUE(contains(text, ">>>\t"s + (temp / "root" / "alpha").string()));
   EXPECT_EQ(text.rfind(">>>\t"s + (temp / "root").string() + "\n"s),
             text.rfind(">>>\t"s));
}

TEST(Shell, ReconstructFlowReportsErrorsWithoutFailing)
{
   test::Temp_directory temp{"chunk_split_shell_error"};
   test::write_file(temp / chunk_file_name(0), "x"s);
   test::write_file(temp / std::string{metadata_file_name},
                    R"({"original_filename": "chunk000"})"s);

   // entries: "..", Reconstruct, Exit
   std::istringstream in{"2\n"s};
   std::ostringstream out;

   EXPECT_EQ(run_reconstruct_flow(temp.path(), in, out, Reconstruct_options{}),
             EXIT_SUCCESS);
   EXPECT_TRUE(contains(out.str(), "Error during reconstruction: "s));
}

TEST(Shell, ReconstructFlowExitLeavesDirectoryUntouched)
{
   test::Temp_directory temp{"chunk_split_shell_exit"};
   make_tree(temp);

   // entries in backup: "..", Reconstruct, Exit
   std::istringstream in{"3\n"s};
   std::ostringstream out;

   EXPECT_EQ(run_reconstruct_flow(temp / "root" / "backup", in, out, Reconstruct_options{}),
             EXIT_SUCCESS);
   EXPECT_FALSE(fs::exists(temp / "root" / "backup" / "notes.txt"));
}
