#include "background_ions.h"
#include "errors.h"

#include <stdexcept>


IonMode parse_ion_mode(const std::string& name) {
    if (name == "immobile") return IonMode::Immobile;
    if (name == "mobile")   return IonMode::Mobile;
    throw ConfigurationError("ions.mode: expected 'immobile' or 'mobile', got '" + name + "'");
}

BackgroundIons BackgroundIons::immobile(const SourceTerms& initial_electrons) {
    BackgroundIons ions;
    ions.mode_ = IonMode::Immobile;
    ions.src_ = SourceTerms(initial_electrons.ro.n);
    for (size_t k = 0; k < ions.src_.ro.data.size(); ++k) {
        ions.src_.ro.data[k] = -initial_electrons.ro.data[k];
    }
    // the ions carry no current
    ions.src_.particle_charge = -initial_electrons.particle_charge;
    ions.src_.abs_charge      =  initial_electrons.abs_charge;
    return ions;
}

BackgroundIons BackgroundIons::mobile(const Grid& grid) {
    BackgroundIons ions;
    ions.mode_ = IonMode::Mobile;
    ions.src_ = SourceTerms(grid.steps());
    return ions;
}

const SourceTerms& BackgroundIons::source_contribution(const Grid& grid) const {
    if (src_.ro.n != grid.steps()) {
        throw std::invalid_argument("BackgroundIons: built for a " + std::to_string(src_.ro.n)
                                    + "-node grid, asked for " + std::to_string(grid.steps()));
    }
    return src_;
}
