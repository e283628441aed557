#include "TransferProgressDialog.hpp"
#include "DisplayFormat.hpp"
#include "OperationCoordinator.hpp"
#include <QCloseEvent>
#include <QFileInfo>
#include <QHBoxLayout>
#include <QLabel>
#include <QProgressBar>
#include <QPushButton>
#include <QVBoxLayout>

TransferProgressDialog::TransferProgressDialog(OperationCoordinator* coordinator,
                                               QWidget* parent)
    : QDialog(parent), coordinator_(coordinator) {
    setWindowTitle(tr("Transfer"));
    setMinimumWidth(420);

    auto* lay = new QVBoxLayout(this);
    titleLabel_ = new QLabel(this);
    titleLabel_->setTextInteractionFlags(Qt::TextSelectableByMouse);
    lay->addWidget(titleLabel_);

    bar_ = new QProgressBar(this);
    bar_->setRange(0, 1000);
    bar_->setValue(0);
    bar_->setTextVisible(false);
    lay->addWidget(bar_);

    statusLabel_ = new QLabel(tr("Queued"), this);
    lay->addWidget(statusLabel_);

    auto* buttons = new QHBoxLayout();
    buttons->addStretch();
    cancelBtn_ = new QPushButton(tr("Cancel"), this);
    closeBtn_ = new QPushButton(tr("Close"), this);
    closeBtn_->setEnabled(false);
    buttons->addWidget(cancelBtn_);
    buttons->addWidget(closeBtn_);
    lay->addLayout(buttons);

    connect(cancelBtn_, &QPushButton::clicked, this,
            &TransferProgressDialog::cancelTransfer);
    connect(closeBtn_, &QPushButton::clicked, this, &QDialog::accept);
}

TransferProgressDialog::~TransferProgressDialog() { release(); }

bool TransferProgressDialog::start(const OperationRequest& request) {
    if (!coordinator_ || handle_ || !isTransferKind(operationKind(request)))
        return false;

    QString src, dst;
    if (const auto* d = std::get_if<DownloadRequest>(&request)) {
        src = QString::fromStdString(d->remote);
        dst = QString::fromStdString(d->local);
        setWindowTitle(tr("Downloading %1").arg(QFileInfo(src).fileName()));
    } else if (const auto* u = std::get_if<UploadRequest>(&request)) {
        src = QString::fromStdString(u->local);
        dst = QString::fromStdString(u->remote);
        setWindowTitle(tr("Uploading %1").arg(QFileInfo(src).fileName()));
    }
    titleLabel_->setText(QString("%1 → %2").arg(src, dst));

    handle_ = coordinator_->run(
        request,
        [this](const TransferProgress& p) { onProgress(p); },
        [this](const OperationOutcome& o) { onDone(o); });
    if (const auto total = handle_->progress().bytesTotal) {
        statusLabel_->setText(
            tr("Queued (%1)").arg(twinpaneui::formatBytes(*total)));
    }
    return true;
}

QString TransferProgressDialog::statusText() const { return statusLabel_->text(); }

int TransferProgressDialog::progressValue() const {
    if (bar_->maximum() == 0)
        return -1;
    return bar_->value();
}

void TransferProgressDialog::onProgress(const TransferProgress& p) {
    if (p.bytesTotal && *p.bytesTotal > 0) {
        bar_->setRange(0, 1000);
        bar_->setValue(static_cast<int>(p.bytesDone * 1000 / *p.bytesTotal));
        statusLabel_->setText(QString("%1 / %2").arg(
            twinpaneui::formatBytes(p.bytesDone),
            twinpaneui::formatBytes(*p.bytesTotal)));
    } else {
        bar_->setRange(0, 0); // busy indicator
        statusLabel_->setText(twinpaneui::formatBytes(p.bytesDone));
    }
}

void TransferProgressDialog::onDone(const OperationOutcome& outcome) {
    finished_ = true;
    cancelBtn_->setEnabled(false);
    closeBtn_->setEnabled(true);
    bar_->setRange(0, 1000);

    switch (outcome.state) {
    case OperationState::Succeeded:
        bar_->setValue(1000);
        statusLabel_->setText(twinpaneui::stateText(outcome.state));
        break;
    case OperationState::Cancelled:
        if (outcome.partial) {
            statusLabel_->setText(
                tr("Canceled after %1; partial file kept at %2")
                    .arg(twinpaneui::formatBytes(outcome.partial->bytesWritten),
                         QString::fromStdString(outcome.partial->path)));
        } else {
            statusLabel_->setText(twinpaneui::stateText(outcome.state));
        }
        break;
    case OperationState::Failed:
        statusLabel_->setText(
            tr("Error: %1").arg(QString::fromStdString(outcome.error.message)));
        break;
    default:
        break;
    }
    emit transferFinished(outcome.state);
}

void TransferProgressDialog::cancelTransfer() {
    if (coordinator_ && handle_ && !finished_) {
        coordinator_->cancel(handle_);
        cancelBtn_->setEnabled(false);
        statusLabel_->setText(tr("Canceling…"));
    }
}

void TransferProgressDialog::reject() {
    // Esc / window close on a running transfer means "stop it".
    cancelTransfer();
    QDialog::reject();
}

void TransferProgressDialog::closeEvent(QCloseEvent* e) {
    cancelTransfer();
    QDialog::closeEvent(e);
    release();
}

void TransferProgressDialog::release() {
    if (coordinator_ && handle_) {
        coordinator_->forget(handle_);
        handle_.reset();
    }
}
