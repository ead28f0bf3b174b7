/// @file src/swing/region_names.cpp
/// @brief Federative-unit code → display name.

#include "votecast/swing.hpp"

#include <array>
#include <utility>

namespace votecast::swing {

namespace {

constexpr std::array<std::pair<std::string_view, std::string_view>, 27> REGION_NAMES{{
    {"AC", "Acre"},              {"AL", "Alagoas"},
    {"AP", "Amapá"},             {"AM", "Amazonas"},
    {"BA", "Bahia"},             {"CE", "Ceará"},
    {"DF", "Distrito Federal"},  {"ES", "Espírito Santo"},
    {"GO", "Goiás"},             {"MA", "Maranhão"},
    {"MT", "Mato Grosso"},       {"MS", "Mato Grosso do Sul"},
    {"MG", "Minas Gerais"},      {"PA", "Pará"},
    {"PB", "Paraíba"},           {"PR", "Paraná"},
    {"PE", "Pernambuco"},        {"PI", "Piauí"},
    {"RJ", "Rio de Janeiro"},    {"RN", "Rio Grande do Norte"},
    {"RS", "Rio Grande do Sul"}, {"RO", "Rondônia"},
    {"RR", "Roraima"},           {"SC", "Santa Catarina"},
    {"SP", "São Paulo"},         {"SE", "Sergipe"},
    {"TO", "Tocantins"},
}};

}  // namespace

std::string region_display_name(std::string_view code) {
    for (const auto& [key, name] : REGION_NAMES) {
        if (key == code) {
            return std::string(name);
        }
    }
    return std::string(code);
}

}  // namespace votecast::swing
