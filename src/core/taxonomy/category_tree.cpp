#include "core/taxonomy/category_tree.h"
#include "core/shared/logging.h"

namespace gr {

CategoryTree::CategoryTree(const QString& rootLabel)
    : m_root(std::make_unique<Node>())
{
    if (!rootLabel.isEmpty()) {
        m_root->label = rootLabel;
    }
}

CategoryTree::~CategoryTree() = default;

CategoryTree::Node* CategoryTree::findChild(const Node& parent, const QString& label,
                                            NodeKind kind)
{
    for (const auto& child : parent.children) {
        if (child->kind == kind && child->label == label) {
            return child.get();
        }
    }
    return nullptr;
}

bool CategoryTree::insertPath(const QStringList& labels)
{
    if (isEmpty()) {
        LOG_WARN(grTaxonomy, "insertPath: tree is empty, ignoring path '%s'",
                 qUtf8Printable(labels.join(QStringLiteral(" > "))));
        return false;
    }
    if (labels.isEmpty()) {
        return false;
    }
    for (const QString& label : labels) {
        if (label.isEmpty()) {
            LOG_WARN(grTaxonomy, "insertPath: empty label in path '%s'",
                     qUtf8Printable(labels.join(QStringLiteral(" > "))));
            return false;
        }
    }

    Node* current = m_root.get();
    for (int i = 0; i < labels.size(); ++i) {
        const NodeKind kind = (i == labels.size() - 1) ? NodeKind::Item : NodeKind::Category;
        Node* next = findChild(*current, labels.at(i), kind);
        if (next == nullptr) {
            auto node = std::make_unique<Node>();
            node->label = labels.at(i);
            node->kind = kind;
            next = node.get();
            current->children.push_back(std::move(node));
        }
        current = next;
    }

    std::lock_guard<std::mutex> lock(m_indexMutex);
    if (m_index.has_value() && !m_indexStale) {
        LOG_WARN(grTaxonomy, "insertPath after index build; index is stale until invalidateIndex()");
        m_indexStale = true;
    }
    return true;
}

bool CategoryTree::containsItem(const Node& node, const QString& item)
{
    if (node.kind == NodeKind::Item) {
        return node.label == item;
    }
    for (const auto& child : node.children) {
        if (containsItem(*child, item)) {
            return true;
        }
    }
    return false;
}

QSet<QString> CategoryTree::categoriesOf(const QString& item) const
{
    QSet<QString> categories;
    for (const auto& subtree : m_root->children) {
        if (subtree->kind == NodeKind::Category && containsItem(*subtree, item)) {
            categories.insert(*subtree->label);
        }
    }
    return categories;
}

void CategoryTree::collectItems(const Node& node, QStringList& out, QSet<QString>& seen)
{
    if (node.kind == NodeKind::Item) {
        if (!seen.contains(*node.label)) {
            seen.insert(*node.label);
            out.append(*node.label);
        }
        return;
    }
    for (const auto& child : node.children) {
        collectItems(*child, out, seen);
    }
}

QStringList CategoryTree::allItemNames() const
{
    QStringList names;
    QSet<QString> seen;
    collectItems(*m_root, names, seen);
    return names;
}

CategoryIndex CategoryTree::buildIndex() const
{
    CategoryIndex index;
    const QStringList items = allItemNames();
    index.reserve(items.size());
    for (const QString& item : items) {
        index.insert(item, categoriesOf(item));
    }
    LOG_INFO(grTaxonomy, "Built category index for %lld items",
             static_cast<long long>(index.size()));
    return index;
}

const CategoryIndex& CategoryTree::categoryIndex() const
{
    std::lock_guard<std::mutex> lock(m_indexMutex);
    if (!m_index.has_value()) {
        m_index = buildIndex();
    }
    return *m_index;
}

void CategoryTree::invalidateIndex()
{
    std::lock_guard<std::mutex> lock(m_indexMutex);
    m_index.reset();
    m_indexStale = false;
}

bool CategoryTree::hasIndex() const
{
    std::lock_guard<std::mutex> lock(m_indexMutex);
    return m_index.has_value();
}

bool CategoryTree::isIndexStale() const
{
    std::lock_guard<std::mutex> lock(m_indexMutex);
    return m_indexStale;
}

QStringList CategoryTree::topLevelCategories() const
{
    QStringList categories;
    for (const auto& subtree : m_root->children) {
        if (subtree->kind == NodeKind::Category) {
            categories.append(*subtree->label);
        }
    }
    return categories;
}

bool CategoryTree::containsLabel(const Node& node, const QString& label)
{
    if (node.label == label) {
        return true;
    }
    for (const auto& child : node.children) {
        if (containsLabel(*child, label)) {
            return true;
        }
    }
    return false;
}

bool CategoryTree::contains(const QString& label) const
{
    return !isEmpty() && containsLabel(*m_root, label);
}

int CategoryTree::countNodes(const Node& node)
{
    int count = 1;
    for (const auto& child : node.children) {
        count += countNodes(*child);
    }
    return count;
}

int CategoryTree::size() const
{
    return isEmpty() ? 0 : countNodes(*m_root);
}

void CategoryTree::appendIndented(const Node& node, int depth, QString& out)
{
    out += QString(depth * 2, QLatin1Char(' '));
    out += node.label.value_or(QString());
    out += QLatin1Char('\n');
    for (const auto& child : node.children) {
        appendIndented(*child, depth + 1, out);
    }
}

QString CategoryTree::toString() const
{
    if (isEmpty()) {
        return {};
    }
    QString out;
    appendIndented(*m_root, 0, out);
    out.chop(1);
    return out;
}

} // namespace gr
