#pragma once
#include <cstddef>
#include <string>
#include <vector>

#include <pc/sim/batch.hpp>
#include <pc/sim/histogram.hpp>

namespace pc::io {

// Écrit un résumé de lot en CSV :
//   # trials=<n>
//   # mean=<moyenne>
//   length,count
//   8,<compte>
//   ...
// Lignes triées par longueur croissante. Lève std::runtime_error si le
// fichier ne peut pas être ouvert.
void write_histogram_csv(const std::string& path, const pc::sim::BatchSummary& summary);

// Relit un histogramme écrit par write_histogram_csv (ou tout CSV avec des
// colonnes length/count, synonymes acceptés). Lignes vides et '#' ignorées.
// Les lignes invalides (longueur ou compte non entier, compte nul) sont
// comptées dans num_ignored et décrites dans warnings (optionnels).
// Lève std::runtime_error si le fichier ne peut pas être ouvert ou si
// l'en-tête n'a pas de colonne length/count.
pc::sim::Histogram
read_histogram_csv(const std::string& path,
                   std::size_t* num_ignored = nullptr,
                   std::vector<std::string>* warnings = nullptr);

} // namespace pc::io
