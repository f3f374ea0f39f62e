#include "test/test_helpers.h"

class EnsembleRunnerTest : public ::testing::Test
{
protected:
    EnsembleConfig MakeConfig(int num_trials, double t_max, unsigned int num_threads = 1)
    {
        EnsembleConfig config;
        config.run = reference_run_config();
        config.num_trials = num_trials;
        config.t_max = t_max;
        config.seed = 12345;
        config.trial_seed = 12345;
        config.num_threads = num_threads;
        config.note = "fixed initial conditions";
        return config;
    }
};

TEST_F(EnsembleRunnerTest, StepCountIsFloorOfDurationOverDt)
{
    EnsembleRunner runner(MakeConfig(1, 100.0), true);
    EXPECT_EQ(runner.get_num_steps(), 1000);

    EnsembleRunner shorter(MakeConfig(1, 0.95), true);
    EXPECT_EQ(shorter.get_num_steps(), 9);

    EnsembleRunner empty(MakeConfig(1, 0.0), true);
    EXPECT_EQ(empty.get_num_steps(), 0);
}

TEST_F(EnsembleRunnerTest, ProducesAlignedRunsAndMean)
{
    EnsembleRunner runner(MakeConfig(4, 10.0), true);
    EnsembleResult result = runner.run();

    ASSERT_EQ(result.runs.size(), 4u);
    for (const auto &run : result.runs)
    {
        ASSERT_EQ(run.size(), 101u);
        EXPECT_EQ(run.front().susceptible, 195);
        EXPECT_EQ(run.front().infected, 5);
        EXPECT_EQ(run.front().recovered, 0);
    }
    ASSERT_EQ(result.mean.size(), 101u);
    ASSERT_EQ(result.stddev.size(), 101u);
    EXPECT_NEAR(result.mean.back().time, 10.0, 1e-9);
}

TEST_F(EnsembleRunnerTest, MeanCountsStayInBoundsAndSumToPopulation)
{
    EnsembleRunner runner(MakeConfig(5, 20.0), true);
    EnsembleResult result = runner.run();

    for (const auto &point : result.mean)
    {
        EXPECT_GE(point.susceptible, 0.0);
        EXPECT_LE(point.susceptible, 200.0);
        EXPECT_GE(point.infected, 0.0);
        EXPECT_LE(point.infected, 200.0);
        EXPECT_GE(point.recovered, 0.0);
        EXPECT_LE(point.recovered, 200.0);
        EXPECT_NEAR(point.susceptible + point.infected + point.recovered, 200.0, 1e-9);
    }
}

TEST_F(EnsembleRunnerTest, TrialsStartFromIdenticalConfigurationAndThenDiverge)
{
    EnsembleRunner runner(MakeConfig(2, 50.0), true);
    SimulationEngine first = runner.make_trial_engine(0);
    SimulationEngine second = runner.make_trial_engine(1);

    const InitialConfiguration &shared = runner.get_initial_configuration();
    for (size_t i = 0; i < shared.positions.size(); ++i)
    {
        EXPECT_EQ(first.get_positions()[i].x, second.get_positions()[i].x);
        EXPECT_EQ(first.get_positions()[i].y, second.get_positions()[i].y);
        EXPECT_EQ(first.get_velocities()[i].x, second.get_velocities()[i].x);
        EXPECT_EQ(first.get_velocities()[i].y, second.get_velocities()[i].y);
        EXPECT_EQ(first.get_states()[i], second.get_states()[i]);
        EXPECT_EQ(first.get_positions()[i].x, shared.positions[i].x);
    }

    first.run_steps(runner.get_num_steps());
    second.run_steps(runner.get_num_steps());

    bool diverged = false;
    for (size_t j = 0; j < first.get_history().size(); ++j)
    {
        if (first.get_history()[j].infected != second.get_history()[j].infected ||
            first.get_history()[j].recovered != second.get_history()[j].recovered)
        {
            diverged = true;
            break;
        }
    }
    EXPECT_TRUE(diverged);

    // Running trials never touches the shared configuration.
    EXPECT_EQ(runner.get_initial_configuration().positions[0].x, shared.positions[0].x);
    SimulationEngine third = runner.make_trial_engine(2);
    EXPECT_EQ(third.get_positions()[0].x, shared.positions[0].x);
}

TEST_F(EnsembleRunnerTest, SeedReproducesSharedConfiguration)
{
    EnsembleRunner a(MakeConfig(1, 1.0), true);
    EnsembleRunner b(MakeConfig(1, 1.0), true);
    EnsembleConfig other_config = MakeConfig(1, 1.0);
    other_config.seed = 54321;
    EnsembleRunner c(other_config, true);

    const auto &pa = a.get_initial_configuration().positions;
    const auto &pb = b.get_initial_configuration().positions;
    const auto &pc = c.get_initial_configuration().positions;
    ASSERT_EQ(pa.size(), pb.size());
    for (size_t i = 0; i < pa.size(); ++i)
    {
        EXPECT_EQ(pa[i].x, pb[i].x);
        EXPECT_EQ(pa[i].y, pb[i].y);
    }
    EXPECT_NE(pa[0].x, pc[0].x);
}

TEST_F(EnsembleRunnerTest, ResultsDoNotDependOnThreadCount)
{
    EnsembleRunner serial(MakeConfig(6, 15.0, 1), true);
    EnsembleRunner parallel(MakeConfig(6, 15.0, 4), true);
    EnsembleResult a = serial.run();
    EnsembleResult b = parallel.run();

    ASSERT_EQ(a.runs.size(), b.runs.size());
    for (size_t k = 0; k < a.runs.size(); ++k)
    {
        ASSERT_EQ(a.runs[k].size(), b.runs[k].size());
        for (size_t j = 0; j < a.runs[k].size(); ++j)
        {
            EXPECT_EQ(a.runs[k][j].susceptible, b.runs[k][j].susceptible);
            EXPECT_EQ(a.runs[k][j].infected, b.runs[k][j].infected);
            EXPECT_EQ(a.runs[k][j].recovered, b.runs[k][j].recovered);
        }
    }
}

TEST_F(EnsembleRunnerTest, NoInitialInfectedGivesFlatMean)
{
    EnsembleConfig config = MakeConfig(3, 10.0);
    config.run.initial_infected = 0;
    EnsembleRunner runner(config, true);
    EnsembleResult result = runner.run();

    for (const auto &point : result.mean)
    {
        EXPECT_DOUBLE_EQ(point.susceptible, 200.0);
        EXPECT_DOUBLE_EQ(point.infected, 0.0);
    }
    for (const auto &point : result.stddev)
    {
        EXPECT_DOUBLE_EQ(point.infected, 0.0);
    }
}

TEST_F(EnsembleRunnerTest, ResultCarriesConfigurationMetadata)
{
    EnsembleRunner runner(MakeConfig(2, 1.0), true);
    EnsembleResult result = runner.run();

    EXPECT_EQ(result.config.num_trials, 2);
    EXPECT_EQ(result.config.seed, 12345u);
    EXPECT_EQ(result.config.note, "fixed initial conditions");
    EXPECT_EQ(result.config.run.population, 200);
    EXPECT_EQ(result.initial.positions.size(), 200u);
}
