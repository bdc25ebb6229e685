#ifndef MAINWINDOW_H
#define MAINWINDOW_H

#include "actionguard.h"

#include <QMainWindow>
#include <QMessageBox>
#include <QString>

#include <functional>

class ModelRunner;
class QButtonGroup;
class QComboBox;
class QLabel;
class QPlainTextEdit;
class QPushButton;
class QRadioButton;

class MainWindow : public QMainWindow
{
    Q_OBJECT

public:
    enum class InputMode {
        Text,
        Image,
    };

    // receives the prompts and errors shown to the user, a QMessageBox by default
    using MessageSink = std::function<void(QMessageBox::Icon icon, const QString &title, const QString &text)>;

    explicit MainWindow(ModelRunner &runner, QWidget *parent = nullptr);

    void setMessageSink(const MessageSink &sink);

    InputMode inputMode() const;
    void setInputMode(InputMode mode);
    QString selectedFile() const;
    void setSelectedFile(const QString &path);

public slots:
    void browseFile();
    void runImageToText();
    void runTextToSpeech();
    void clearOutput();

private:
    void initializeWindow();
    void updateInputState();
    void setBusy(bool busy);
    void requestMoreInformation(const QString &message);
    void showError(const QString &message);
    void showMessage(QMessageBox::Icon icon, const QString &title, const QString &text);

    ModelRunner &m_runner;
    ActionGuard m_guard;
    MessageSink m_messageSink;
    bool m_busy = false;

    QString m_filePath;
    QString m_lastText;

    QComboBox *m_modelBox = nullptr;
    QRadioButton *m_textModeButton = nullptr;
    QRadioButton *m_imageModeButton = nullptr;
    QPushButton *m_captionButton = nullptr;
    QPushButton *m_speechButton = nullptr;
    QPushButton *m_clearButton = nullptr;
    QPlainTextEdit *m_textInput = nullptr;
    QPlainTextEdit *m_captionOutput = nullptr;
    QLabel *m_modelInfo = nullptr;
};

#endif // MAINWINDOW_H
