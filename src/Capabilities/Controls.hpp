#pragma once

#include <QString>
#include <QStringList>
#include <QUrl>
#include <QVariantMap>
#include "Capability.hpp"





/** The protocol-agnostic capability interfaces.
A Connection implements any subset of these and advertises the matching capabilities; the Device hands out
the interface of the Connection that wins the capability resolution.
All functions are asynchronous, the outcome is reported through the handlers. */





class Launcher
{
public:
	static const QString App;
	static const QString AppParams;
	static const QString AppClose;
	static const QString AppList;
	static const QString Browser;
	static const QString YouTube;
	static const QString Netflix;

	static QStringList allCapabilities();

	virtual ~Launcher() {}

	virtual void launchApp(
		const QString & aAppID,
		const QVariantMap & aParams,
		Capability::SuccessHandler aOnSuccess,
		Capability::FailureHandler aOnFailure
	) = 0;

	virtual void closeApp(
		const QString & aAppID,
		Capability::SuccessHandler aOnSuccess,
		Capability::FailureHandler aOnFailure
	) = 0;

	virtual void launchBrowser(
		const QUrl & aUrl,
		Capability::SuccessHandler aOnSuccess,
		Capability::FailureHandler aOnFailure
	) = 0;
};





class MediaPlayer
{
public:
	static const QString DisplayImage;
	static const QString PlayVideo;
	static const QString PlayAudio;
	static const QString Close;

	static QStringList allCapabilities();

	virtual ~MediaPlayer() {}

	virtual void displayImage(
		const QUrl & aUrl,
		const QString & aMimeType,
		Capability::SuccessHandler aOnSuccess,
		Capability::FailureHandler aOnFailure
	) = 0;

	virtual void playMedia(
		const QUrl & aUrl,
		const QString & aMimeType,
		bool aShouldLoop,
		Capability::SuccessHandler aOnSuccess,
		Capability::FailureHandler aOnFailure
	) = 0;

	virtual void closeMedia(Capability::SuccessHandler aOnSuccess, Capability::FailureHandler aOnFailure) = 0;
};





class MediaControl
{
public:
	static const QString Play;
	static const QString Pause;
	static const QString Stop;
	static const QString Rewind;
	static const QString FastForward;
	static const QString Seek;
	static const QString Position;

	static QStringList allCapabilities();

	virtual ~MediaControl() {}

	virtual void play(Capability::SuccessHandler aOnSuccess, Capability::FailureHandler aOnFailure) = 0;
	virtual void pause(Capability::SuccessHandler aOnSuccess, Capability::FailureHandler aOnFailure) = 0;
	virtual void stop(Capability::SuccessHandler aOnSuccess, Capability::FailureHandler aOnFailure) = 0;
	virtual void rewind(Capability::SuccessHandler aOnSuccess, Capability::FailureHandler aOnFailure) = 0;
	virtual void fastForward(Capability::SuccessHandler aOnSuccess, Capability::FailureHandler aOnFailure) = 0;

	/** Seeks to the specified position, in seconds from the start of the media. */
	virtual void seek(double aPosition, Capability::SuccessHandler aOnSuccess, Capability::FailureHandler aOnFailure) = 0;
};





class VolumeControl
{
public:
	static const QString Get;
	static const QString Set;
	static const QString UpDown;
	static const QString MuteGet;
	static const QString MuteSet;

	static QStringList allCapabilities();

	using VolumeHandler = std::function<void(float aVolume)>;
	using MuteHandler = std::function<void(bool aIsMuted)>;

	virtual ~VolumeControl() {}

	/** Reports the current volume, in the range 0 .. 1. */
	virtual void getVolume(VolumeHandler aOnSuccess, Capability::FailureHandler aOnFailure) = 0;

	/** Sets the volume, in the range 0 .. 1. */
	virtual void setVolume(float aVolume, Capability::SuccessHandler aOnSuccess, Capability::FailureHandler aOnFailure) = 0;

	virtual void volumeUp(Capability::SuccessHandler aOnSuccess, Capability::FailureHandler aOnFailure) = 0;
	virtual void volumeDown(Capability::SuccessHandler aOnSuccess, Capability::FailureHandler aOnFailure) = 0;
	virtual void getMute(MuteHandler aOnSuccess, Capability::FailureHandler aOnFailure) = 0;
	virtual void setMute(bool aIsMuted, Capability::SuccessHandler aOnSuccess, Capability::FailureHandler aOnFailure) = 0;
};





class TVControl
{
public:
	static const QString ChannelUp;
	static const QString ChannelDown;
	static const QString ChannelSet;
	static const QString ChannelGet;
	static const QString ChannelList;

	static QStringList allCapabilities();

	virtual ~TVControl() {}

	virtual void channelUp(Capability::SuccessHandler aOnSuccess, Capability::FailureHandler aOnFailure) = 0;
	virtual void channelDown(Capability::SuccessHandler aOnSuccess, Capability::FailureHandler aOnFailure) = 0;
	virtual void setChannel(const QString & aChannelID, Capability::SuccessHandler aOnSuccess, Capability::FailureHandler aOnFailure) = 0;
};





class KeyControl
{
public:
	static const QString Up;
	static const QString Down;
	static const QString Left;
	static const QString Right;
	static const QString OK;
	static const QString Back;
	static const QString Home;
	static const QString KeyCode;

	static QStringList allCapabilities();

	enum Key
	{
		kUp,
		kDown,
		kLeft,
		kRight,
		kOK,
		kBack,
		kHome,
	};

	virtual ~KeyControl() {}

	virtual void sendKey(Key aKey, Capability::SuccessHandler aOnSuccess, Capability::FailureHandler aOnFailure) = 0;

	/** Sends a raw, protocol-specific key code. */
	virtual void sendKeyCode(int aKeyCode, Capability::SuccessHandler aOnSuccess, Capability::FailureHandler aOnFailure) = 0;
};





class TextInputControl
{
public:
	static const QString Send;
	static const QString Enter;
	static const QString Delete;

	static QStringList allCapabilities();

	virtual ~TextInputControl() {}

	virtual void sendText(const QString & aText, Capability::SuccessHandler aOnSuccess, Capability::FailureHandler aOnFailure) = 0;
	virtual void sendEnter(Capability::SuccessHandler aOnSuccess, Capability::FailureHandler aOnFailure) = 0;
	virtual void sendDelete(Capability::SuccessHandler aOnSuccess, Capability::FailureHandler aOnFailure) = 0;
};





class MouseControl
{
public:
	static const QString Connect;
	static const QString Disconnect;
	static const QString Click;
	static const QString Move;
	static const QString Scroll;

	static QStringList allCapabilities();

	virtual ~MouseControl() {}

	virtual void connectMouse(Capability::SuccessHandler aOnSuccess, Capability::FailureHandler aOnFailure) = 0;
	virtual void disconnectMouse() = 0;
	virtual void click(Capability::SuccessHandler aOnSuccess, Capability::FailureHandler aOnFailure) = 0;
	virtual void move(double aDx, double aDy, Capability::SuccessHandler aOnSuccess, Capability::FailureHandler aOnFailure) = 0;
	virtual void scroll(double aDx, double aDy, Capability::SuccessHandler aOnSuccess, Capability::FailureHandler aOnFailure) = 0;
};





class PowerControl
{
public:
	static const QString Off;
	static const QString On;

	static QStringList allCapabilities();

	virtual ~PowerControl() {}

	virtual void powerOff(Capability::SuccessHandler aOnSuccess, Capability::FailureHandler aOnFailure) = 0;
	virtual void powerOn(Capability::SuccessHandler aOnSuccess, Capability::FailureHandler aOnFailure) = 0;
};





class ToastControl
{
public:
	static const QString Show;
	static const QString ShowClickableApp;
	static const QString ShowClickableUrl;

	static QStringList allCapabilities();

	virtual ~ToastControl() {}

	virtual void showToast(const QString & aMessage, Capability::SuccessHandler aOnSuccess, Capability::FailureHandler aOnFailure) = 0;
};





class WebAppLauncher
{
public:
	static const QString Launch;
	static const QString LaunchParams;
	static const QString MessageSend;
	static const QString Close;
	static const QString Join;

	static QStringList allCapabilities();

	virtual ~WebAppLauncher() {}

	virtual void launchWebApp(
		const QString & aWebAppID,
		const QVariantMap & aParams,
		Capability::SuccessHandler aOnSuccess,
		Capability::FailureHandler aOnFailure
	) = 0;

	virtual void joinWebApp(const QString & aWebAppID, Capability::SuccessHandler aOnSuccess, Capability::FailureHandler aOnFailure) = 0;
	virtual void closeWebApp(const QString & aWebAppID, Capability::SuccessHandler aOnSuccess, Capability::FailureHandler aOnFailure) = 0;
};





class ExternalInputControl
{
public:
	static const QString PickerLaunch;
	static const QString PickerClose;
	static const QString List;
	static const QString Set;

	static QStringList allCapabilities();

	using InputListHandler = std::function<void(const QStringList & aInputIDs)>;

	virtual ~ExternalInputControl() {}

	virtual void launchInputPicker(Capability::SuccessHandler aOnSuccess, Capability::FailureHandler aOnFailure) = 0;
	virtual void closeInputPicker(Capability::SuccessHandler aOnSuccess, Capability::FailureHandler aOnFailure) = 0;
	virtual void getExternalInputList(InputListHandler aOnSuccess, Capability::FailureHandler aOnFailure) = 0;
	virtual void setExternalInput(const QString & aInputID, Capability::SuccessHandler aOnSuccess, Capability::FailureHandler aOnFailure) = 0;
};
