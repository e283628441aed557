// Progress dialog for a single download or upload run through the
// coordinator. Cancel requests cancellation; closing the dialog forgets it.
#pragma once
#include "OperationCoordinator.hpp"
#include "OperationHandle.hpp"
#include "OperationRequest.hpp"
#include <QDialog>
#include <QPointer>

class QLabel;
class QProgressBar;
class QPushButton;

class TransferProgressDialog : public QDialog {
    Q_OBJECT
public:
    explicit TransferProgressDialog(OperationCoordinator* coordinator,
                                    QWidget* parent = nullptr);
    ~TransferProgressDialog() override;

    // Only Download/Upload requests are accepted; returns false otherwise or
    // when a transfer is already shown.
    bool start(const OperationRequest& request);

    OperationHandlePtr handle() const { return handle_; }
    QString statusText() const;
    int progressValue() const; // 0..1000, -1 while busy/indeterminate

signals:
    void transferFinished(OperationState state);

public slots:
    void cancelTransfer();
    void reject() override;

protected:
    void closeEvent(QCloseEvent* e) override;

private:
    void onProgress(const TransferProgress& p);
    void onDone(const OperationOutcome& outcome);
    void release();

    QPointer<OperationCoordinator> coordinator_; // not owned
    OperationHandlePtr handle_;
    bool finished_ = false;
    QLabel* titleLabel_ = nullptr;   // source -> destination
    QLabel* statusLabel_ = nullptr;  // bytes / final state
    QProgressBar* bar_ = nullptr;
    QPushButton* cancelBtn_ = nullptr;
    QPushButton* closeBtn_ = nullptr;
};
