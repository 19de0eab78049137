/**
 * @file technique_step.cpp
 * @brief TechniqueStep construction and formatting.
 */

#include <sudokulogic/technique_step.hpp>

namespace sudokulogic {

bool TechniqueApplication::operator==(const TechniqueApplication& other) const noexcept {
    if (kind != other.kind) {
        return false;
    }
    if (kind == Kind::Placement) {
        return position == other.position && digit == other.digit;
    }
    return positions == other.positions && digits == other.digits;
}

TechniqueStep TechniqueStep::from_diff(std::string technique_name,
                                       const ConditionCells& condition_cells,
                                       ConditionDigitCells condition_digit_cells,
                                       const TechniqueGrid& before, const TechniqueGrid& after,
                                       std::vector<TechniqueApplication> extra_application) {
    std::vector<TechniqueApplication> application = collect_applications_from_diff(before, after);
    application.insert(application.end(), extra_application.begin(), extra_application.end());
    return TechniqueStep(std::move(technique_name), condition_cells,
                         std::move(condition_digit_cells), std::move(application));
}

std::string TechniqueStep::describe() const {
    std::string text = technique_name_ + ":";
    bool first = true;
    for (const TechniqueApplication& app : application_) {
        text += first ? " " : "; ";
        first = false;
        if (app.is_placement()) {
            text += "place " + std::to_string(digit_value(app.digit)) + " at " +
                    format_positions(DigitPositions::from_elem(app.position));
        } else {
            text += "remove " + format_digits(app.digits) + " from " + format_positions(app.positions);
        }
    }
    return text;
}

std::vector<TechniqueApplication> collect_applications_from_diff(const TechniqueGrid& before,
                                                                 const TechniqueGrid& after) {
    std::vector<TechniqueApplication> application;
    for (Digit digit : ALL_DIGITS) {
        DigitPositions removed =
            before.digit_positions(digit).difference(after.digit_positions(digit));
        if (!removed.empty()) {
            application.push_back(
                TechniqueApplication::elimination(removed, DigitSet::from_elem(digit)));
        }
    }
    return application;
}

std::string format_positions(const DigitPositions& positions) {
    std::string text;
    for (Position pos : positions) {
        if (!text.empty()) {
            text.push_back(' ');
        }
        text += "r" + std::to_string(pos.y() + 1) + "c" + std::to_string(pos.x() + 1);
    }
    return text;
}

std::string format_digits(const DigitSet& digits) {
    std::string text;
    for (Digit digit : digits) {
        if (!text.empty()) {
            text.push_back(',');
        }
        text += std::to_string(digit_value(digit));
    }
    return text;
}

} // namespace sudokulogic
