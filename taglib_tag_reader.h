#ifndef TAGLIB_TAG_READER_H
#define TAGLIB_TAG_READER_H

#include <map>
#include <string>

#include "tag_reader.h"

/**
 * @class TagLibTagReader
 * @brief Extrator de tags ID3v2 (MP3) baseado na TagLib
 *
 * Cada campo semântico (TagField) é lido de um frame ID3v2 fixo. A tabela
 * de frames é montada e validada uma única vez, no construtor.
 */
class TagLibTagReader : public TagReader
{
public:
    TagLibTagReader();

    TagReadResult read(const std::string &path) const override;

    // Frame ID3v2 associado a um campo (ex: Title -> "TIT2")
    const std::string &frameId(TagField field) const;

private:
    std::map<TagField, std::string> frameIds;
};

#endif // TAGLIB_TAG_READER_H
