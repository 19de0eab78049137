/**
 * @file techniques.cpp
 * @brief Technique presets and name lookup.
 */

#include <sudokulogic/techniques.hpp>

#include <cctype>

namespace sudokulogic {

namespace {

bool equals_ignore_case(std::string_view lhs, std::string_view rhs) noexcept {
    if (lhs.size() != rhs.size()) {
        return false;
    }
    for (std::size_t i = 0; i < lhs.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(lhs[i])) !=
            std::tolower(static_cast<unsigned char>(rhs[i]))) {
            return false;
        }
    }
    return true;
}

} // namespace

std::vector<BoxedTechnique> all_techniques() {
    std::vector<BoxedTechnique> techniques;
    techniques.push_back(std::make_unique<NakedSingle>());
    techniques.push_back(std::make_unique<HiddenSingle>());
    techniques.push_back(std::make_unique<LockedCandidates>());
    techniques.push_back(std::make_unique<NakedPair>());
    techniques.push_back(std::make_unique<HiddenPair>());
    techniques.push_back(std::make_unique<NakedTriple>());
    techniques.push_back(std::make_unique<HiddenTriple>());
    techniques.push_back(std::make_unique<NakedQuad>());
    techniques.push_back(std::make_unique<HiddenQuad>());
    techniques.push_back(std::make_unique<XWing>());
    techniques.push_back(std::make_unique<Skyscraper>());
    techniques.push_back(std::make_unique<YWing>());
    return techniques;
}

std::vector<BoxedTechnique> fundamental_techniques() {
    std::vector<BoxedTechnique> techniques;
    techniques.push_back(std::make_unique<NakedSingle>());
    techniques.push_back(std::make_unique<HiddenSingle>());
    return techniques;
}

BoxedTechnique technique_by_name(std::string_view name) {
    for (BoxedTechnique& technique : all_techniques()) {
        if (equals_ignore_case(technique->name(), name)) {
            return std::move(technique);
        }
    }
    return nullptr;
}

} // namespace sudokulogic
