#ifndef COMPARE_H
#define COMPARE_H

#include <vector>

#include "entry.h"

/**
 * @brief Compara duas entradas pelos critérios em ordem
 * @param a Primeira entrada
 * @param b Segunda entrada
 * @param keys Critérios de ordenação (o primeiro tem prioridade)
 * @return Negativo se a < b, zero se iguais, positivo se a > b
 *
 * Se um critério empata, passa para o próximo. Sem critérios, tudo empata.
 * - Título, artista, álbum e gênero: sem diferenciar maiúsculas/minúsculas,
 *   usando o nome de ordenação (TSOT/TSOP/TSOA) quando existir
 * - Nome do arquivo: comparação exata byte a byte
 * - Ano e faixa: valor ausente vem antes de valor presente
 */
int compareEntries(const Entry &a, const Entry &b, const std::vector<SortKey> &keys);

/**
 * @brief Ordena (ordenação estável) as entradas pelos critérios
 * @param reverse Inverte o resultado final da comparação, não cada critério
 */
void sortEntries(std::vector<Entry> &entries, const std::vector<SortKey> &keys, bool reverse);

#endif // COMPARE_H
