#include "RelationFinder.hpp"
#include "StringUtils.hpp"

#include <algorithm>
#include <initializer_list>

namespace FS = std::filesystem;

RelationFinder::RelationFinder(const RunContext& Context, const MediaClassifier& Classifier)
    : Config(Context.Config), Log(Context.Log), Classifier(Classifier)
{
}

bool RelationFinder::StemsRelated(const std::string& PrimaryStem, const std::string& OtherStem)
{
    if (PrimaryStem == OtherStem)
    {
        return true;
    }
    for (const char* Separator : { "_", " " })
    {
        if (PrimaryStem.starts_with(OtherStem + Separator) || OtherStem.starts_with(PrimaryStem + Separator))
        {
            return true;
        }
    }
    return false;
}

std::vector<FS::path> RelationFinder::RelatedFiles(const FS::path& Primary) const
{
    std::vector<FS::path> Related;
    if (!Config.RelatedSameStem)
    {
        return Related;
    }

    const FS::path Parent = Primary.parent_path();
    const std::string Stem = PathToUtf8(Primary.stem());

    std::error_code ec;
    FS::directory_iterator It(Parent, ec);
    if (ec)
    {
        Log.Warn("Cannot list related files in " + Parent.string() + ": " + ec.message());
        return Related;
    }

    for (; It != FS::directory_iterator(); It.increment(ec))
    {
        const FS::directory_entry& Entry = *It;
        std::error_code StatusEc;
        if (!Entry.is_regular_file(StatusEc) || Entry.is_symlink(StatusEc))
        {
            continue;
        }
        if (Entry.path() == Primary)
        {
            continue;
        }
        if (Classifier.ShouldLeaveInPlace(Entry.path()))
        {
            continue;
        }
        if (StemsRelated(Stem, PathToUtf8(Entry.path().stem())))
        {
            Related.push_back(Entry.path());
        }
    }

    std::sort(Related.begin(), Related.end(), [](const FS::path& A, const FS::path& B) {
        return A.filename() < B.filename();
    });
    return Related;
}
