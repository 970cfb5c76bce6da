#ifndef PASTICHE_TRAINING_HPP
#define PASTICHE_TRAINING_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "/details"
#include "details/loop.hpp"
#include "details/fit.hpp"

namespace Pastiche::Training {
    using LoopOptions = Details::LoopOptions;
    using StepMetrics = Details::StepMetrics;
    using TrainingLoop = Details::TrainingLoop;
    using FitOptions = Details::FitOptions;
    using SampleImages = Details::SampleImages;

    using Details::batch_images;
    using Details::fit;
}

#endif // PASTICHE_TRAINING_HPP
