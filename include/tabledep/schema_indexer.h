#pragma once

#include <tabledep/interfaces.h>
#include <tabledep/logging.h>

#include <memory>
#include <string>
#include <vector>

namespace tabledep {

// Folds the lines of one schema file into `index`. The table context does
// not carry over between files.
void IndexSchemaLines(const std::vector<std::string> &lines,
                      SchemaIndex &index);

class RailsSchemaIndexer : public SchemaIndexer {
public:
  explicit RailsSchemaIndexer(std::shared_ptr<Logger> logger = nullptr);
  SchemaIndex BuildIndex(const CategorizedFiles &files,
                         const LoadedSources &sources) override;

private:
  std::shared_ptr<Logger> logger_;
};

} // namespace tabledep
