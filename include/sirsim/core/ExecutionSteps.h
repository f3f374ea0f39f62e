#pragma once

#include "include/sirsim/core/IExecutionStep.h"

class MotionIntegrationStep : public IExecutionStep
{
public:
    explicit MotionIntegrationStep(double dt);
    void execute(RunState &state, RandomEngine &rng) const override;

private:
    double m_dt;
};

// Elastic walls: each axis is clamped and reflected independently.
class BoundaryReflectionStep : public IExecutionStep
{
public:
    explicit BoundaryReflectionStep(double domain_size);
    void execute(RunState &state, RandomEngine &rng) const override;

private:
    double m_domain_size;
};

// Every Susceptible agent draws at most once per step: at the first agent of
// the start-of-step Infected list (in index order) closer than the radius.
class InfectionStep : public IExecutionStep
{
public:
    InfectionStep(double infection_radius, double probability);
    void execute(RunState &state, RandomEngine &rng) const override;

private:
    double m_infection_radius;
    double m_probability;
};

// Only agents Infected at the start of the step are eligible.
class RecoveryStep : public IExecutionStep
{
public:
    explicit RecoveryStep(double probability);
    void execute(RunState &state, RandomEngine &rng) const override;

private:
    double m_probability;
};
