#ifndef PASTICHE_CONFIG_HPP
#define PASTICHE_CONFIG_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "/details"
#include "details/run.hpp"

namespace Pastiche::Config {
    using RunConfig = Details::RunConfig;

    using Details::apply_json;
    using Details::load_json;
}

#endif // PASTICHE_CONFIG_HPP
