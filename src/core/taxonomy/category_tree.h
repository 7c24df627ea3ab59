#pragma once

#include <QHash>
#include <QSet>
#include <QString>
#include <QStringList>

#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace gr {

using CategoryIndex = QHash<QString, QSet<QString>>;

// Rooted multi-way tree of category labels whose leaves are items.
//
// Nodes carry an explicit kind rather than inferring "item" from having no
// children, so an item named like a category never merges with it and a
// category with no items yet is still a category.
//
// Built once, then read-only. The item -> categories index is computed on
// first use and kept until invalidateIndex() is called; inserting after the
// index exists marks it stale but does not recompute it.
class CategoryTree {
public:
    enum class NodeKind {
        Root,
        Category,
        Item,
    };

    // An empty rootLabel yields the empty tree, which accepts no paths.
    explicit CategoryTree(const QString& rootLabel = QStringLiteral("All Games"));
    ~CategoryTree();

    CategoryTree(const CategoryTree&) = delete;
    CategoryTree& operator=(const CategoryTree&) = delete;

    bool isEmpty() const { return !m_root->label.has_value(); }
    QString rootLabel() const { return m_root->label.value_or(QString()); }

    // Every label but the last is a category (descending into an existing
    // sibling with the same label); the last label becomes an item leaf.
    // Returns false for the empty tree, an empty path, or an empty label.
    bool insertPath(const QStringList& labels);

    // Top-level categories under which item appears as a leaf.
    QSet<QString> categoriesOf(const QString& item) const;

    // Item leaves in depth-first order, each listed once.
    QStringList allItemNames() const;

    // Builds the index on first call. The returned reference stays valid
    // until invalidateIndex() or destruction of the tree; callers that may
    // race with invalidateIndex() must copy the entries they need.
    const CategoryIndex& categoryIndex() const;
    void invalidateIndex();
    bool hasIndex() const;
    bool isIndexStale() const;

    QStringList topLevelCategories() const;
    bool contains(const QString& label) const;
    int size() const;
    QString toString() const;

private:
    struct Node {
        std::optional<QString> label;
        NodeKind kind = NodeKind::Root;
        std::vector<std::unique_ptr<Node>> children;
    };

    static Node* findChild(const Node& parent, const QString& label, NodeKind kind);
    static bool containsItem(const Node& node, const QString& item);
    static bool containsLabel(const Node& node, const QString& label);
    static void collectItems(const Node& node, QStringList& out, QSet<QString>& seen);
    static int countNodes(const Node& node);
    static void appendIndented(const Node& node, int depth, QString& out);

    CategoryIndex buildIndex() const;

    std::unique_ptr<Node> m_root;

    mutable std::mutex m_indexMutex;
    mutable std::optional<CategoryIndex> m_index;
    bool m_indexStale = false;
};

} // namespace gr
