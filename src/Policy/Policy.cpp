//
// Created by moinshaikh on 3/3/26.
//

#include<fstream>
#include<iterator>
#include<stdexcept>

#include<spdlog/spdlog.h>

#include"../../include/Policy/Policy.hpp"

#include<doctest/doctest.h>

namespace PolicyHub
{
    void CorePolicy::save(const std::filesystem::path &path) const
    {
        writePolicyState(path, getState());
    }

    bool CorePolicy::load(const std::filesystem::path &path)
    {
        auto state = readPolicyState(path);
        if (!state)
        {
            spdlog::warn("Policy state is not loaded because no file is found at {}", path.string());
            return false;
        }
        setState(*state);
        return true;
    }

    void writePolicyState(const std::filesystem::path &path, const PolicyState &state)
    {
        if (path.has_parent_path())
        {
            std::filesystem::create_directories(path.parent_path());
        }
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        if (!out)
        {
            throw std::runtime_error("Cannot open " + path.string() + " for writing");
        }
        out.write(state.data(), static_cast<std::streamsize>(state.size()));
        if (!out)
        {
            throw std::runtime_error("Failed to write policy state to " + path.string());
        }
    }

    std::optional<PolicyState> readPolicyState(const std::filesystem::path &path)
    {
        if (!std::filesystem::exists(path))
        {
            return std::nullopt;
        }
        std::ifstream in(path, std::ios::binary);
        if (!in)
        {
            throw std::runtime_error("Cannot open " + path.string() + " for reading");
        }
        return PolicyState(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }

    TEST_CASE("Policy state files")
    {
        auto dir = std::filesystem::temp_directory_path() / "policyhub_state_test";
        std::filesystem::remove_all(dir);

        SUBCASE("Binary states survive a write and read")
        {
            PolicyState state("weights\0with\0nulls", 18);
            writePolicyState(dir / "nested" / "policy", state);
            auto loaded = readPolicyState(dir / "nested" / "policy");
            REQUIRE(loaded.has_value());
            CHECK(*loaded == state);
        }

        SUBCASE("Missing files read as nullopt")
        {
            CHECK_FALSE(readPolicyState(dir / "absent").has_value());
        }

        std::filesystem::remove_all(dir);
    }
}
