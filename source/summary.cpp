// summary.cpp - change tally

#include <confdiff/summary.h>

namespace confdiff {

Summary summarize(const ChangeList& changes) noexcept
{
    Summary summary;
    for (const auto& change : changes) {
        switch (change.kind) {
            case ChangeRecord::Kind::Addition:     ++summary.additions; break;
            case ChangeRecord::Kind::Deletion:     ++summary.deletions; break;
            case ChangeRecord::Kind::Modification: ++summary.modifications; break;
        }
    }
    return summary;
}

} // namespace confdiff
