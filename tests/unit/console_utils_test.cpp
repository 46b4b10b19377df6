#include "ConsoleUtils.hpp"
#include "symmorph/security/SecureString.hpp"
#include <gtest/gtest.h>
#include <iostream>
#include <sstream>

#if defined(__linux__)
#include <sys/mman.h>
#endif

namespace
{

// Swaps std::cin / std::cout for string streams for the lifetime of the object.
class StdStreamSwap final
{
public:
    explicit StdStreamSwap(const std::string& inputData)
        : m_input{ inputData }, m_oldCin{ std::cin.rdbuf(m_input.rdbuf()) }, m_oldCout{ std::cout.rdbuf(m_output.rdbuf()) }
    {
    }
    StdStreamSwap(const StdStreamSwap&) = delete;
    StdStreamSwap& operator=(const StdStreamSwap&) = delete;
    ~StdStreamSwap()
    {
        std::cin.rdbuf(m_oldCin);
        std::cout.rdbuf(m_oldCout);
    }

    [[nodiscard]] std::string written() const
    {
        return m_output.str();
    }

private:
    std::istringstream m_input;
    std::ostringstream m_output;
    std::streambuf* m_oldCin;
    std::streambuf* m_oldCout;
};

} // namespace

TEST(ConsoleUtilsTest, LockProcessMemoryIsSafeToCall)
{
    symmorph::ui::cli::lockProcessMemory();

#if defined(__linux__)
    munlockall();
#endif
    SUCCEED();
}

TEST(ConsoleUtilsTest, ReadPasswordReadsOneLineAfterPrompt)
{
    StdStreamSwap swap{ "StrongPassword123\nnext line\n" };

    const auto result{ symmorph::ui::cli::readPassword("Password: ") };

    EXPECT_EQ(symmorph::security::asStringView(result), "StrongPassword123");
    EXPECT_EQ(swap.written(), "Password: \n");
}

TEST(ConsoleUtilsTest, ReadPasswordKeepsInnerSpaces)
{
    StdStreamSwap swap{ "correct horse battery\n" };
    EXPECT_EQ(symmorph::security::asStringView(symmorph::ui::cli::readPassword("P: ")), "correct horse battery");
}

TEST(ConsoleUtilsTest, ReadPasswordHandlesEmptyInput)
{
    StdStreamSwap swap{ "\n" };
    EXPECT_TRUE(symmorph::security::asStringView(symmorph::ui::cli::readPassword("P: ")).empty());
}
