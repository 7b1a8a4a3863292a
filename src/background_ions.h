#pragma once
#include <string>

#include "deposition.h"
#include "grid.h"

enum class IonMode { Immobile, Mobile };

// "immobile" | "mobile", throws ConfigurationError otherwise
IonMode parse_ion_mode(const std::string& name);

// Ion charge background added to the plasma sources every slice.
// Immobile: the exact negative of the initial electron deposit, so the
// unperturbed plasma is neutral. Mobile: the ions are a pushed population
// and the background is empty.
class BackgroundIons {
public:
    BackgroundIons() = default;

    static BackgroundIons immobile(const SourceTerms& initial_electrons);
    static BackgroundIons mobile(const Grid& grid);

    IonMode mode() const { return mode_; }

    // Partial sources of the background; throws std::invalid_argument if
    // `grid` is not the grid the background was built on.
    const SourceTerms& source_contribution(const Grid& grid) const;

private:
    IonMode     mode_ = IonMode::Immobile;
    SourceTerms src_;
};
