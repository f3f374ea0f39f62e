#pragma once

enum class SimErrc
{
    // General Errors
    UnknownError,
    OutputFileWriteFailed,

    // Model Configuration Errors
    InvalidPopulation,
    InvalidDomainSize,
    InvalidTimeStep,
    InvalidSpeed,
    InitialInfectedOutOfRange,
    InvalidRate,
    InvalidProbability,
    InvalidInitialConfiguration,

    // Ensemble Configuration Errors
    InvalidTrialCount,
    InvalidDuration,

    // Invariant Errors
    InvariantViolation,

    // Ensemble Consistency Errors
    EnsembleStepMismatch,
    EmptyEnsemble,

    // I/O Errors
    CsvFileNotFound,
    CsvColumnNotFound,
    CsvConversionError,
    RecipeFileNotFound,
    RecipeParseError,
    RecipeConfigError
};
