#include "RemoteModel.hpp"
#include "DisplayFormat.hpp"
#include "OperationCoordinator.hpp"
#include <QVariant>

RemoteModel::RemoteModel(OperationCoordinator* coordinator, QObject* parent)
  : QAbstractListModel(parent), coordinator_(coordinator) {
  if (coordinator_) countItems_ = coordinator_->settings().countDirectoryItems;
}

RemoteModel::~RemoteModel() {
  if (coordinator_ && pending_) {
    coordinator_->cancel(pending_);
    coordinator_->forget(pending_);
  }
}

int RemoteModel::rowCount(const QModelIndex& parent) const {
  if (parent.isValid()) return 0;
  return static_cast<int>(items_.size());
}

QVariant RemoteModel::data(const QModelIndex& index, int role) const {
  if (!index.isValid() || index.row() < 0 || index.row() >= (int)items_.size())
    return {};
  const auto& it = items_[index.row()];
  switch (role) {
  case Qt::DisplayRole:
    return it.name + (it.isDir ? "/" : "");
  case Qt::ToolTipRole: {
    if (it.isDir) {
      if (it.itemCount >= 0) return QString("Folder, %1 items").arg(it.itemCount);
      return QStringLiteral("Folder");
    }
    return QString("%1, %2, %3").arg(twinpaneui::formatBytes(it.size),
                                     twinpaneui::modeString(it.mode, false),
                                     twinpaneui::localShortTime(it.mtime));
  }
  case IsDirRole: return it.isDir;
  case SizeRole: return QVariant::fromValue<quint64>(it.size);
  case MtimeRole: return QVariant::fromValue<quint64>(it.mtime);
  case ModeRole: return twinpaneui::modeString(it.mode, it.isDir);
  case ItemCountRole:
    return it.itemCount >= 0 ? QVariant(it.itemCount) : QVariant();
  default:
    return {};
  }
}

Qt::ItemFlags RemoteModel::flags(const QModelIndex& index) const {
  if (!index.isValid()) return Qt::NoItemFlags;
  return Qt::ItemIsEnabled | Qt::ItemIsSelectable;
}

void RemoteModel::setRootPath(const QString& path) {
  if (!coordinator_) {
    emit loadFailed(QStringLiteral("No SFTP session"));
    return;
  }
  if (pending_) {
    coordinator_->cancel(pending_);
    coordinator_->forget(pending_);
    pending_.reset();
  }
  ListRequest req;
  req.path = path.toStdString();
  req.countItems = countItems_;
  pending_ = coordinator_->run(req, {}, [this](const OperationOutcome& outcome) {
    applyOutcome(outcome);
  });
}

void RemoteModel::applyOutcome(const OperationOutcome& outcome) {
  if (pending_ && coordinator_) coordinator_->forget(pending_);
  pending_.reset();
  if (outcome.state == OperationState::Cancelled) return;
  if (outcome.state == OperationState::Failed) {
    emit loadFailed(QString::fromStdString(outcome.error.message));
    return;
  }
  const auto* listing = std::get_if<DirectoryListing>(&outcome.payload);
  if (!listing) return;

  beginResetModel();
  items_.clear();
  items_.reserve(listing->entries.size());
  for (const auto& f : listing->entries) {
    items_.push_back({ QString::fromStdString(f.name), f.is_dir, f.size, f.mtime,
                       f.mode, f.item_count ? static_cast<int>(*f.item_count) : -1 });
  }
  currentPath_ = QString::fromStdString(listing->path);
  endResetModel();
  emit rootPathChanged(currentPath_);
}

bool RemoteModel::isDir(const QModelIndex& idx) const {
  if (!idx.isValid()) return false;
  return items_[idx.row()].isDir;
}
QString RemoteModel::nameAt(const QModelIndex& idx) const {
  if (!idx.isValid()) return {};
  return items_[idx.row()].name;
}
