/**
 * @file test_syscall_filter.cpp
 * @brief Unit tests for the table of filesystem-mutating syscalls.
 * @author CodeVerdict contributors
 */

#include "sandbox/syscall_filter.hpp"

#include <gtest/gtest.h>
#include <fcntl.h>
#include <algorithm>
#include <string_view>

using namespace code_verdict;

namespace {

const MutatingSyscall* find_entry(std::string_view name) {
    const auto table = mutating_syscalls();
    const auto it = std::find_if(table.begin(), table.end(),
                                 [name](const MutatingSyscall& entry) { return entry.name == name; });
    return it == table.end() ? nullptr : &*it;
}

}  // namespace

TEST(SyscallFilterTest, DescriptorFormsAreCheckedThroughTheDescriptor) {
    for (std::string_view name : {"fchmod", "fchown", "fsetxattr", "fremovexattr"}) {
        const auto* entry = find_entry(name);
        ASSERT_NE(entry, nullptr) << name;
        EXPECT_EQ(entry->first.dirfd_arg, 0) << name;
        EXPECT_EQ(entry->first.path_arg, kDescriptorOperand) << name;
    }
    const auto* futimesat = find_entry("futimesat");
    ASSERT_NE(futimesat, nullptr);
    EXPECT_EQ(futimesat->first.path_arg, 1);
}

TEST(SyscallFilterTest, HardLinksCheckBothPaths) {
    const auto* link = find_entry("link");
    ASSERT_NE(link, nullptr);
    EXPECT_EQ(link->first.path_arg, 1);
    EXPECT_EQ(link->second.path_arg, 0);

    const auto* linkat = find_entry("linkat");
    ASSERT_NE(linkat, nullptr);
    EXPECT_EQ(linkat->first.dirfd_arg, 2);
    EXPECT_EQ(linkat->first.path_arg, 3);
    EXPECT_EQ(linkat->second.dirfd_arg, 0);
    EXPECT_EQ(linkat->second.path_arg, 1);
}

TEST(SyscallFilterTest, OnlyOpenFormsCarryFlags) {
    for (const auto& entry : mutating_syscalls()) {
        const bool is_open = entry.name == "open" || entry.name == "openat";
        EXPECT_EQ(entry.flags_arg >= 0, is_open) << entry.name;
    }
}

TEST(SyscallFilterTest, OpensForWriting) {
    EXPECT_FALSE(opens_for_writing(O_RDONLY));
    EXPECT_FALSE(opens_for_writing(O_RDONLY | O_CLOEXEC | O_DIRECTORY));
    EXPECT_TRUE(opens_for_writing(O_WRONLY));
    EXPECT_TRUE(opens_for_writing(O_RDWR | O_CLOEXEC));
    EXPECT_TRUE(opens_for_writing(O_RDONLY | O_CREAT));
    EXPECT_TRUE(opens_for_writing(O_RDONLY | O_TRUNC));
}
