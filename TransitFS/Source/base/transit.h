// *****************************************************************************
// * This file is part of the TransitFS project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#ifndef TRANSIT_H_2094715538621907
#define TRANSIT_H_2094715538621907

#include <variant>
#include "../afs/abstract.h"


namespace tfs
{
struct TransferConflict //target already occupied
{
    FileType fileType = FileType::unknown; //of the source item
    Zstring origin;
    Zstring destination;
};

struct TransitNormal {};

//why the progress handler is called for the current item
using TransitState = std::variant<TransitNormal, TransferConflict, zen::FileError>;

struct TransitProgress
{
    uint64_t processedBytes = 0;
    uint64_t totalBytes     = 0;
    uint64_t processedFiles = 0;
    uint64_t totalFiles     = 0;
    TransitState state;
};

enum class TransitProgressResponse
{
    continueOrAbort, //raise conflict or error; just continue after success
    skip,
    overwrite,       //retry same transfer with overwrite = true
    abort,           //stop traversal, no rollback; operation returns normally
};

//called once per leaf transfer attempt; runs on the thread of the engine call
using TransitProgressHandler = std::function<TransitProgressResponse(const TransitProgress& progress)>; //throw X


struct TotalStats
{
    uint64_t bytes = 0;
    uint64_t files = 0; //all non-folder items
};
TotalStats calculateTotalStats(const AfsDevice& device, const std::vector<AfsPath>& itemPaths); //throw FileError

//sum of sizes of all non-folder items at or below itemPaths
inline uint64_t calculateTotalSize(const AfsDevice& device, const std::vector<AfsPath>& itemPaths) { return calculateTotalStats(device, itemPaths).bytes; } //throw FileError

//post-order: folders are removed after all their children
void removeAll(const AfsDevice& device, const std::vector<AfsPath>& itemPaths); //throw FileError

//------------------------------------------------------------------------------------------
//items end up as targetFolder/<item name>; target folder must exist!
//CONTRACT: item paths must not contain the target folder

void moveFiles(const AfsDevice& device, const std::vector<AfsPath>& itemPaths, const AfsPath& targetFolder); //throw FileError
void copyFiles(const AfsDevice& device, const std::vector<AfsPath>& itemPaths, const AfsPath& targetFolder); //throw FileError

void moveFilesWithProgress(const AfsDevice& device, const std::vector<AfsPath>& itemPaths, const AfsPath& targetFolder, const TransitProgressHandler& onProgress); //throw FileError, X
void copyFilesWithProgress(const AfsDevice& device, const std::vector<AfsPath>& itemPaths, const AfsPath& targetFolder, const TransitProgressHandler& onProgress); //throw FileError, X

//read on "deviceFrom", write to "targetFolder.afsDevice": file content is buffered in memory
void moveFilesBetween(const AfsDevice& deviceFrom, const std::vector<AfsPath>& itemPaths, const AbstractPath& targetFolder); //throw FileError
void copyFilesBetween(const AfsDevice& deviceFrom, const std::vector<AfsPath>& itemPaths, const AbstractPath& targetFolder); //throw FileError

void moveFilesBetweenWithProgress(const AfsDevice& deviceFrom, const std::vector<AfsPath>& itemPaths, const AbstractPath& targetFolder, const TransitProgressHandler& onProgress); //throw FileError, X
void copyFilesBetweenWithProgress(const AfsDevice& deviceFrom, const std::vector<AfsPath>& itemPaths, const AbstractPath& targetFolder, const TransitProgressHandler& onProgress); //throw FileError, X
}

#endif //TRANSIT_H_2094715538621907
