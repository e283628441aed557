#pragma once
#include <QAbstractListModel>
#include <QPointer>
#include <QString>
#include <vector>
#include "OperationCoordinator.hpp"

// Remote directory listing. Loads run through the coordinator, so the model
// is populated asynchronously and setRootPath() never blocks.
class RemoteModel : public QAbstractListModel {
  Q_OBJECT
public:
  enum Roles {
    IsDirRole = Qt::UserRole + 1,
    SizeRole,
    MtimeRole,
    ModeRole,
    ItemCountRole
  };

  explicit RemoteModel(OperationCoordinator* coordinator, QObject* parent = nullptr);
  ~RemoteModel() override;

  int rowCount(const QModelIndex& parent = QModelIndex()) const override;
  QVariant data(const QModelIndex& index, int role) const override;
  Qt::ItemFlags flags(const QModelIndex& index) const override;

  // Starts loading path; a load still in flight is cancelled and forgotten.
  void setRootPath(const QString& path);
  QString rootPath() const { return currentPath_; }
  bool isLoading() const { return pending_ != nullptr; }

  void setCountItems(bool on) { countItems_ = on; }

  bool isDir(const QModelIndex& idx) const;
  QString nameAt(const QModelIndex& idx) const;

signals:
  // path is the resolved directory (with "~" expanded).
  void rootPathChanged(const QString& path);
  void loadFailed(const QString& message);

private:
  void applyOutcome(const OperationOutcome& outcome);

  QPointer<OperationCoordinator> coordinator_; // not owned; may go first
  OperationHandlePtr pending_;
  bool countItems_ = false;
  QString currentPath_;
  struct Item {
    QString name;
    bool isDir;
    quint64 size;
    quint64 mtime;
    quint32 mode;
    int itemCount; // -1 when unknown
  };
  std::vector<Item> items_;
};
