#pragma once

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>
#include <cstdio>
#include <memory>
#include <array>

#include "include/sirsim/core/SimulationEngine.h"
#include "include/sirsim/core/SimulationException.h"
#include "include/sirsim/ensemble/EnsembleRunner.h"
#include "include/sirsim/io/io.h"

inline void create_test_file(const std::string &filename, const std::string &content)
{
    std::ofstream test_file(filename);
    test_file << content;
    test_file.close();
}

inline std::string read_file_content(const std::string &path)
{
    std::ifstream file(path);
    if (!file.is_open())
    {
        return "ERROR: FILE_NOT_FOUND";
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

inline std::string exec_command(const char *cmd)
{
    std::array<char, 128> buffer;
    std::string result;

#ifdef _WIN32
    std::unique_ptr<FILE, decltype(&_pclose)> pipe(_popen(cmd, "r"), _pclose);
#else
    std::unique_ptr<FILE, decltype(&pclose)> pipe(popen(cmd, "r"), pclose);
#endif

    if (!pipe)
    {
        throw std::runtime_error("popen() failed!");
    }
    while (fgets(buffer.data(), static_cast<int>(buffer.size()), pipe.get()) != nullptr)
    {
        result += buffer.data();
    }
    return result;
}

// Parameters of the reference particle scenario.
inline RunConfig reference_run_config()
{
    RunConfig config;
    config.domain_size = 10.0;
    config.population = 200;
    config.initial_infected = 5;
    config.max_speed = 0.5;
    config.infection_radius = 0.3;
    config.infection_rate = 0.8;
    config.recovery_rate = 0.1;
    config.dt = 0.1;
    return config;
}

// Motionless agents at fixed positions, for tests that need exact control over contacts.
inline InitialConfiguration stationary_agents(const std::vector<Vec2> &positions, const std::vector<HealthState> &states)
{
    InitialConfiguration initial;
    initial.positions = positions;
    initial.velocities.assign(positions.size(), Vec2{0.0, 0.0});
    initial.states = states;
    return initial;
}

inline RunConfig small_run_config(int population, double infection_rate, double recovery_rate)
{
    RunConfig config;
    config.domain_size = 10.0;
    config.population = population;
    config.initial_infected = 0;
    config.max_speed = 0.0;
    config.infection_radius = 0.5;
    config.infection_rate = infection_rate;
    config.recovery_rate = recovery_rate;
    config.dt = 0.1;
    return config;
}

class FileCleanupTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        remove_test_files();
    }

    void TearDown() override
    {
        remove_test_files();
    }

private:
    static void remove_test_files()
    {
        std::remove("test_output.csv");
        std::remove("test_report.json");
        std::remove("recipe.json");
        std::remove("err.json");
        std::remove("preview_test.json");
        std::remove("initial_config.csv");
        std::remove("bad_config.csv");
    }
};
