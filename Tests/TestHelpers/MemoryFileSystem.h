// *****************************************************************************
// * This file is part of the TransitFS project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#ifndef MEMORY_FILE_SYSTEM_H_3816402957163847
#define MEMORY_FILE_SYSTEM_H_3816402957163847

#include <compare>
#include <map>
#include <set>
#include <zen/thread.h>
#include <TransitFS/Source/afs/abstract.h>


namespace tfs::test
{
enum class MemOp
{
    createFile,
    createFolder,
    moveItem,
    copyItem,
    removeFile,
    removeFolder,
    getFileContent,
    readFolder,
    setUnixPermissions,
};

//successful mutating calls in execution order
struct MemCall
{
    MemOp op = MemOp::createFile;
    Zstring path;
    Zstring pathTo; //moveItem, copyItem
    bool overwrite = false;

    bool operator==(const MemCall&) const = default;
};


/*  in-memory backend for engine tests:
      - root "/" always exists
      - parent folders must exist before creating children
      - special item types (socket, fifo, ...) can be planted with addSpecial()
      - failures can be injected per operation and path                     */
class MemoryFileSystem : public AbstractFileSystem
{
public:
    static std::shared_ptr<MemoryFileSystem> create() { return std::make_shared<MemoryFileSystem>(); }

    //------------------------ setup -------------------------
    void addFolder(const Zstring& folderPath) { plant(folderPath, {.type = FileType::dir}); }
    void addFile(const Zstring& filePath, const std::string& content) { plant(filePath, {.type = FileType::file, .content = content}); }
    //content: what a read through the link would return
    void addSymlink(const Zstring& linkPath, const std::string& content) { plant(linkPath, {.type = FileType::symlink, .content = content}); }
    void addSpecial(const Zstring& itemPath, FileType type) { plant(itemPath, {.type = type}); }

    void injectFailure(MemOp op, const Zstring& itemPath) { state_.access([&](State& s) { s.failures.emplace(op, itemPath); }); }

    //------------------------ inspection --------------------
    bool contains(const Zstring& itemPath) const { return state_.access([&](State& s) { return s.items.contains(itemPath); }); }

    std::optional<FileType> typeOf(const Zstring& itemPath) const
    {
        return state_.access([&](State& s) -> std::optional<FileType>
        {
            if (auto it = s.items.find(itemPath); it != s.items.end())
                return it->second.type;
            return {};
        });
    }

    std::optional<std::string> contentOf(const Zstring& itemPath) const
    {
        return state_.access([&](State& s) -> std::optional<std::string>
        {
            if (auto it = s.items.find(itemPath); it != s.items.end() && it->second.type != FileType::dir)
                return it->second.content;
            return {};
        });
    }

    std::optional<UnixPermissions> permissionsOf(const Zstring& itemPath) const
    {
        return state_.access([&](State& s) -> std::optional<UnixPermissions>
        {
            if (auto it = s.items.find(itemPath); it != s.items.end())
                return it->second.perms;
            return {};
        });
    }

    std::vector<MemCall> getCalls() const { return state_.access([](State& s) { return s.calls; }); }

    std::vector<MemCall> getCalls(MemOp op) const
    {
        std::vector<MemCall> output;
        for (const MemCall& c : getCalls())
            if (c.op == op)
                output.push_back(c);
        return output;
    }

    void clearCalls() { state_.access([](State& s) { s.calls.clear(); }); }

    int disconnectCount() const { return state_.access([](State& s) { return s.disconnects; }); }

protected:
    struct Node
    {
        FileType type = FileType::file;
        std::string content;
        std::optional<UnixPermissions> perms;
    };

    struct State
    {
        std::map<Zstring, Node> items; //key: normalized absolute path
        std::set<std::pair<MemOp, Zstring>> failures;
        std::vector<MemCall> calls;
        int disconnects = 0;
    };

    void plant(const Zstring& itemPath, const Node& node)
    {
        state_.access([&](State& s)
        {
            for (std::optional<Zstring> parentPath = zen::getParentPath(itemPath); parentPath && *parentPath != Zstr("/"); parentPath = zen::getParentPath(*parentPath))
                s.items.try_emplace(*parentPath, Node{.type = FileType::dir});
            s.items[itemPath] = node;
        });
    }

    static void checkFailure(const State& s, MemOp op, const AfsPath& itemPath) //throw FileError
    {
        if (s.failures.contains({op, itemPath.value}))
            throw zen::FileError(zen::replaceCpy<std::wstring>(L"Injected failure for %x.", L"%x", zen::fmtPath(itemPath.value)));
    }

    static const Node& getNode(const State& s, const AfsPath& itemPath) //throw ErrorTargetNotExisting
    {
        if (itemPath.value == Zstr("/"))
            return rootNode();

        auto it = s.items.find(itemPath.value);
        if (it == s.items.end())
            throw zen::ErrorTargetNotExisting(zen::replaceCpy<std::wstring>(L"Item %x is not existing.", L"%x", zen::fmtPath(itemPath.value)), L"", itemPath.value);
        return it->second;
    }

    static bool exists(const State& s, const AfsPath& itemPath) { return itemPath.value == Zstr("/") || s.items.contains(itemPath.value); }

    static void checkParentFolder(const State& s, const AfsPath& itemPath) //throw ErrorTargetNotExisting
    {
        const std::optional<AfsPath> parentPath = getParentPath(itemPath);
        if (!parentPath || getNode(s, *parentPath).type != FileType::dir)
            throw zen::ErrorTargetNotExisting(zen::replaceCpy<std::wstring>(L"Parent folder of %x is not existing.", L"%x", zen::fmtPath(itemPath.value)), L"", itemPath.value);
    }

    static void checkTarget(const State& s, const AfsPath& itemPath, bool overwrite) //throw FileError, ErrorTargetExisting
    {
        checkParentFolder(s, itemPath); //throw ErrorTargetNotExisting
        if (exists(s, itemPath))
        {
            if (!overwrite)
                throw zen::ErrorTargetExisting(zen::replaceCpy<std::wstring>(L"Item %x is already existing.", L"%x", zen::fmtPath(itemPath.value)), L"", itemPath.value);
            if (getNode(s, itemPath).type == FileType::dir)
                throw zen::FileError(zen::replaceCpy<std::wstring>(L"Cannot overwrite folder %x.", L"%x", zen::fmtPath(itemPath.value)));
        }
    }

    static bool hasChildren(const State& s, const AfsPath& folderPath)
    {
        const Zstring prefix = zen::appendSeparator(folderPath.value);
        auto it = s.items.upper_bound(prefix);
        return it != s.items.end() && zen::startsWith(it->first, prefix);
    }

    static const Node& rootNode()
    {
        static const Node root{.type = FileType::dir};
        return root;
    }

    static Metadata toMetadata(const Node& node)
    {
        Metadata md{.type = node.type, .modTime = 1700000000};
        if (node.type == FileType::file)
            md.fileSize = node.content.size();
        md.unixPermissions = node.perms;
        return md;
    }

    //----------------------------------------------------------------------------------------------------------------
    Zstring getInitPathPhrase(const AfsPath& itemPath) const override { return Zstr("mem:") + itemPath.value; }

    std::wstring getDisplayPath(const AfsPath& itemPath) const override { return L"mem:" + zen::utfTo<std::wstring>(itemPath.value); }

    std::weak_ordering compareDeviceSameAfsType(const AbstractFileSystem& afsRhs) const override
    {
        return std::compare_three_way()(static_cast<const AbstractFileSystem*>(this), &afsRhs); //every instance is a separate device
    }

    void disconnect() const override { state_.access([](State& s) { ++s.disconnects; }); }

    bool itemExists(const AfsPath& itemPath) const override { return state_.access([&](State& s) { return exists(s, itemPath); }); }

    FileType getFileType(const AfsPath& itemPath) const override //throw FileError
    {
        return state_.access([&](State& s) { return getNode(s, itemPath).type; }); //throw ErrorTargetNotExisting
    }

    Metadata getMetadata(const AfsPath& itemPath) const override //throw FileError
    {
        return state_.access([&](State& s) { return toMetadata(getNode(s, itemPath)); }); //throw ErrorTargetNotExisting
    }

    std::string getFileContent(const AfsPath& filePath) const override //throw FileError
    {
        return state_.access([&](State& s)
        {
            checkFailure(s, MemOp::getFileContent, filePath); //throw FileError
            const Node& node = getNode(s, filePath); //throw ErrorTargetNotExisting
            if (node.type == FileType::dir)
                throw zen::FileError(zen::replaceCpy<std::wstring>(L"Cannot read folder %x.", L"%x", zen::fmtPath(filePath.value)));
            return node.content;
        });
    }

    std::vector<File> readFolder(const AfsPath& folderPath) const override //throw FileError
    {
        return state_.access([&](State& s)
        {
            checkFailure(s, MemOp::readFolder, folderPath); //throw FileError
            if (getNode(s, folderPath).type != FileType::dir) //throw ErrorTargetNotExisting
                throw zen::FileError(zen::replaceCpy<std::wstring>(L"%x is not a folder.", L"%x", zen::fmtPath(folderPath.value)));

            std::vector<File> files;
            for (const auto& [itemPath, node] : s.items)
                if (const std::optional<Zstring> parentPath = zen::getParentPath(itemPath);
                    parentPath && *parentPath == folderPath.value)
                    files.push_back(makeFile(AfsPath(itemPath), toMetadata(node))); //throw ErrorNoFileName, ErrorNotUtf8Path
            return files;
        });
    }

    void createFile(const AfsPath& filePath, bool overwrite, std::optional<std::string_view> content) const override //throw FileError, ErrorTargetExisting
    {
        state_.access([&](State& s)
        {
            checkFailure(s, MemOp::createFile, filePath); //throw FileError
            checkTarget(s, filePath, overwrite); //throw FileError, ErrorTargetExisting
            s.items[filePath.value] = Node{.type = FileType::file, .content = content ? std::string(*content) : std::string()};
            s.calls.push_back({MemOp::createFile, filePath.value, {}, overwrite});
        });
    }

    void createFolder(const AfsPath& folderPath) const override //throw FileError, ErrorTargetExisting
    {
        state_.access([&](State& s)
        {
            checkFailure(s, MemOp::createFolder, folderPath); //throw FileError
            checkTarget(s, folderPath, false /*overwrite*/); //throw FileError, ErrorTargetExisting
            s.items[folderPath.value] = Node{.type = FileType::dir};
            s.calls.push_back({MemOp::createFolder, folderPath.value});
        });
    }

    void moveItem(const AfsPath& pathFrom, const AfsPath& pathTo, bool overwrite) const override //throw FileError, ErrorTargetExisting
    {
        state_.access([&](State& s)
        {
            checkFailure(s, MemOp::moveItem, pathFrom); //throw FileError
            const Node node = getNode(s, pathFrom); //throw ErrorTargetNotExisting
            checkTarget(s, pathTo, overwrite); //throw FileError, ErrorTargetExisting

            if (node.type == FileType::dir) //move the whole subtree
            {
                const Zstring prefixFrom = zen::appendSeparator(pathFrom.value);
                std::map<Zstring, Node> movedItems;
                for (auto it = s.items.begin(); it != s.items.end();)
                    if (zen::startsWith(it->first, prefixFrom))
                    {
                        movedItems.emplace(zen::appendPath(pathTo.value, it->first.substr(prefixFrom.size())), it->second);
                        it = s.items.erase(it);
                    }
                    else
                        ++it;
                s.items.merge(movedItems);
            }
            s.items.erase(pathFrom.value);
            s.items[pathTo.value] = node;
            s.calls.push_back({MemOp::moveItem, pathFrom.value, pathTo.value, overwrite});
        });
    }

    void copyItem(const AfsPath& pathFrom, const AfsPath& pathTo, bool overwrite) const override //throw FileError, ErrorTargetExisting
    {
        state_.access([&](State& s)
        {
            checkFailure(s, MemOp::copyItem, pathFrom); //throw FileError
            const Node node = getNode(s, pathFrom); //throw ErrorTargetNotExisting
            if (!isTransferableLeaf(node.type))
                throw ErrorFileTypeUnsupported(zen::replaceCpy<std::wstring>(L"Cannot copy %x.", L"%x", zen::fmtPath(pathFrom.value)), L"", pathFrom.value);

            checkTarget(s, pathTo, overwrite); //throw FileError, ErrorTargetExisting
            s.items[pathTo.value] = node;
            s.calls.push_back({MemOp::copyItem, pathFrom.value, pathTo.value, overwrite});
        });
    }

    void removeFile(const AfsPath& filePath) const override //throw FileError
    {
        state_.access([&](State& s)
        {
            checkFailure(s, MemOp::removeFile, filePath); //throw FileError
            if (getNode(s, filePath).type == FileType::dir) //throw ErrorTargetNotExisting
                throw zen::FileError(zen::replaceCpy<std::wstring>(L"Cannot delete folder %x as a file.", L"%x", zen::fmtPath(filePath.value)));
            s.items.erase(filePath.value);
            s.calls.push_back({MemOp::removeFile, filePath.value});
        });
    }

    void removeFolder(const AfsPath& folderPath) const override //throw FileError
    {
        state_.access([&](State& s)
        {
            checkFailure(s, MemOp::removeFolder, folderPath); //throw FileError
            if (getNode(s, folderPath).type != FileType::dir) //throw ErrorTargetNotExisting
                throw zen::FileError(zen::replaceCpy<std::wstring>(L"%x is not a folder.", L"%x", zen::fmtPath(folderPath.value)));
            if (folderPath.value == Zstr("/") || hasChildren(s, folderPath))
                throw zen::FileError(zen::replaceCpy<std::wstring>(L"Cannot delete non-empty folder %x.", L"%x", zen::fmtPath(folderPath.value)));
            s.items.erase(folderPath.value);
            s.calls.push_back({MemOp::removeFolder, folderPath.value});
        });
    }

    void moveToRecycleBin(const std::vector<AfsPath>& itemPaths) const override //throw FileError, RecycleBinUnavailable
    {
        throw zen::RecycleBinUnavailable(L"The recycle bin is not available for in-memory items.");
    }

    void setUnixPermissions(const AfsPath& itemPath, const UnixPermissions& perms) const override //throw FileError
    {
        state_.access([&](State& s)
        {
            checkFailure(s, MemOp::setUnixPermissions, itemPath); //throw FileError
            if (itemPath.value == Zstr("/") || !s.items.contains(itemPath.value))
                throw zen::ErrorTargetNotExisting(zen::replaceCpy<std::wstring>(L"Item %x is not existing.", L"%x", zen::fmtPath(itemPath.value)), L"", itemPath.value);
            s.items[itemPath.value].perms = perms;
            s.calls.push_back({MemOp::setUnixPermissions, itemPath.value});
        });
    }

    mutable zen::Protected<State> state_;
};
}

#endif //MEMORY_FILE_SYSTEM_H_3816402957163847
