#include "mainwindow.h"

#include "logging.h"
#include "modelinfo.h"
#include "modelrunner.h"

#include <QApplication>
#include <QButtonGroup>
#include <QComboBox>
#include <QFileDialog>
#include <QFileInfo>
#include <QGroupBox>
#include <QHBoxLayout>
#include <QLabel>
#include <QMessageBox>
#include <QPlainTextEdit>
#include <QPushButton>
#include <QRadioButton>
#include <QStatusBar>
#include <QVBoxLayout>

static const char *s_imageToText = QT_TRANSLATE_NOOP("MainWindow", "Image-to-Text");
static const char *s_textToSpeech = QT_TRANSLATE_NOOP("MainWindow", "Text-to-Speech");

MainWindow::MainWindow(ModelRunner &runner, QWidget *parent)
    : QMainWindow(parent)
    , m_runner(runner)
    , m_guard([this](const QString &message) {
        setBusy(false);
        showError(message);
    })
{
    setWindowTitle(tr("AI Model Display"));
    initializeWindow();
}

void MainWindow::setMessageSink(const MessageSink &sink)
{
    m_messageSink = sink;
}

void MainWindow::initializeWindow()
{
    QWidget *window = new QWidget(this);
    QVBoxLayout *layout = new QVBoxLayout;

    layout->addWidget(new QLabel(tr("AI Model Selection"), this));
    m_modelBox = new QComboBox(this);
    m_modelBox->addItem(tr(s_imageToText));
    m_modelBox->addItem(tr(s_textToSpeech));
    layout->addWidget(m_modelBox);
    connect(m_modelBox, QOverload<int>::of(&QComboBox::activated), this, [this](int index) {
        setInputMode(index == 0 ? InputMode::Image : InputMode::Text);
    });

    auto inputBox = new QGroupBox(tr("User Input Section"), this);
    auto inputLayout = new QHBoxLayout(inputBox);
    m_textModeButton = new QRadioButton(tr("Text"), inputBox);
    m_imageModeButton = new QRadioButton(tr("Image"), inputBox);
    auto modeGroup = new QButtonGroup(this);
    modeGroup->addButton(m_textModeButton);
    modeGroup->addButton(m_imageModeButton);
    m_textModeButton->setChecked(true);
    auto browseButton = new QPushButton(tr("Browse"), inputBox);
    inputLayout->addWidget(m_textModeButton);
    inputLayout->addWidget(m_imageModeButton);
    inputLayout->addWidget(browseButton);
    layout->addWidget(inputBox);
    connect(m_textModeButton, &QRadioButton::toggled, this, &MainWindow::updateInputState);
    connect(browseButton, &QPushButton::clicked, this, &MainWindow::browseFile);

    auto buttonLayout = new QHBoxLayout;
    m_captionButton = new QPushButton(tr("Run Image-to-Text Model"), this);
    m_speechButton = new QPushButton(tr("Run Text-to-Speech Model"), this);
    m_clearButton = new QPushButton(tr("Clear"), this);
    m_captionButton->setObjectName(QStringLiteral("captionButton"));
    m_speechButton->setObjectName(QStringLiteral("speechButton"));
    m_clearButton->setObjectName(QStringLiteral("clearButton"));
    buttonLayout->addWidget(m_captionButton);
    buttonLayout->addWidget(m_speechButton);
    buttonLayout->addWidget(m_clearButton);
    layout->addLayout(buttonLayout);
    connect(m_captionButton, &QPushButton::clicked, this, &MainWindow::runImageToText);
    connect(m_speechButton, &QPushButton::clicked, this, &MainWindow::runTextToSpeech);
    connect(m_clearButton, &QPushButton::clicked, this, &MainWindow::clearOutput);

    layout->addWidget(new QLabel(tr("Text Input (for TTS)"), this));
    m_textInput = new QPlainTextEdit(this);
    m_textInput->setObjectName(QStringLiteral("textInput"));
    layout->addWidget(m_textInput);

    layout->addWidget(new QLabel(tr("Image Caption Output"), this));
    m_captionOutput = new QPlainTextEdit(this);
    m_captionOutput->setObjectName(QStringLiteral("captionOutput"));
    m_captionOutput->setReadOnly(true);
    layout->addWidget(m_captionOutput);

    layout->addWidget(new QLabel(tr("Model Information"), this));
    m_modelInfo = new QLabel(tr("Run a Model to see its information"), this);
    m_modelInfo->setObjectName(QStringLiteral("modelInfo"));
    m_modelInfo->setTextInteractionFlags(Qt::TextSelectableByMouse);
    layout->addWidget(m_modelInfo);

    window->setLayout(layout);
    setCentralWidget(window);

    updateInputState();
}

MainWindow::InputMode MainWindow::inputMode() const
{
    return m_imageModeButton->isChecked() ? InputMode::Image : InputMode::Text;
}

void MainWindow::setInputMode(InputMode mode)
{
    if (mode == InputMode::Image) {
        m_imageModeButton->setChecked(true);
    } else {
        m_textModeButton->setChecked(true);
    }
}

QString MainWindow::selectedFile() const
{
    return m_filePath;
}

void MainWindow::setSelectedFile(const QString &path)
{
    m_filePath = path;
    if (!path.isEmpty()) {
        statusBar()->showMessage(tr("Selected %1").arg(QFileInfo(path).fileName()));
    }
}

void MainWindow::updateInputState()
{
    const bool textMode = inputMode() == InputMode::Text;
    m_textInput->setEnabled(textMode);
    m_captionOutput->setEnabled(!textMode);
    m_modelBox->setCurrentIndex(textMode ? 1 : 0);
}

void MainWindow::browseFile()
{
    const QString path = QFileDialog::getOpenFileName(this, tr("Select Image"), QString(),
                                                      tr("Images (*.png *.jpg *.jpeg *.bmp *.gif *.webp);;All Files (*)"));
    // a cancelled dialog keeps the previous selection
    if (!path.isEmpty()) {
        setSelectedFile(path);
    }
}

void MainWindow::runImageToText()
{
    ActionLogger logger(QStringLiteral("runImageToText"));

    if (inputMode() != InputMode::Image || m_filePath.isEmpty()) {
        requestMoreInformation(tr("Please select an image file."));
        return;
    }

    setBusy(true);
    m_guard.run([this] {
        const QString caption = m_runner.generateCaption(m_filePath);
        m_captionOutput->setPlainText(tr("Caption: %1").arg(caption));
        m_modelInfo->setText(ModelInfo::captioning(m_runner.captionModel()).toDisplayText());
    });
    setBusy(false);
}

void MainWindow::runTextToSpeech()
{
    ActionLogger logger(QStringLiteral("runTextToSpeech"));

    if (inputMode() != InputMode::Text) {
        requestMoreInformation(tr("Text input required for TTS."));
        return;
    }
    m_lastText = m_textInput->toPlainText().trimmed();
    if (m_lastText.isEmpty()) {
        requestMoreInformation(tr("Please enter text to speak."));
        return;
    }

    setBusy(true);
    m_guard.run([this] {
        const QString path = m_runner.speak(m_lastText);
        m_modelInfo->setText(ModelInfo::speech(m_runner.speechModel()).toDisplayText());
        statusBar()->showMessage(tr("Playing %1").arg(QFileInfo(path).fileName()));
    });
    setBusy(false);
}

void MainWindow::clearOutput()
{
    m_textInput->clear();
    m_captionOutput->clear();
    m_filePath.clear();
    m_lastText.clear();
    statusBar()->clearMessage();
}

void MainWindow::setBusy(bool busy)
{
    if (busy == m_busy) {
        return;
    }
    m_busy = busy;
    m_captionButton->setEnabled(!busy);
    m_speechButton->setEnabled(!busy);
    m_clearButton->setEnabled(!busy);
    if (busy) {
        QApplication::setOverrideCursor(Qt::WaitCursor);
        statusBar()->showMessage(tr("Running model..."));
    } else {
        QApplication::restoreOverrideCursor();
        if (statusBar()->currentMessage() == tr("Running model...")) {
            statusBar()->clearMessage();
        }
    }
}

void MainWindow::requestMoreInformation(const QString &message)
{
    qCDebug(CAPTIONSPEAK_UI) << "Missing input:" << message;
    showMessage(QMessageBox::Information, tr("More information needed"), message);
}

void MainWindow::showError(const QString &message)
{
    showMessage(QMessageBox::Critical, tr("Error"), message);
}

void MainWindow::showMessage(QMessageBox::Icon icon, const QString &title, const QString &text)
{
    if (m_messageSink) {
        m_messageSink(icon, title, text);
        return;
    }
    if (icon == QMessageBox::Critical) {
        QMessageBox::critical(this, title, text);
    } else {
        QMessageBox::information(this, title, text);
    }
}
