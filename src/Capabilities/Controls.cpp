#include "Controls.hpp"





const QString Launcher::App       = "Launcher.App";
const QString Launcher::AppParams = "Launcher.App.Params";
const QString Launcher::AppClose  = "Launcher.App.Close";
const QString Launcher::AppList   = "Launcher.App.List";
const QString Launcher::Browser   = "Launcher.Browser";
const QString Launcher::YouTube   = "Launcher.YouTube";
const QString Launcher::Netflix   = "Launcher.Netflix";

QStringList Launcher::allCapabilities()
{
	return {App, AppParams, AppClose, AppList, Browser, YouTube, Netflix};
}





const QString MediaPlayer::DisplayImage = "MediaPlayer.Display.Image";
const QString MediaPlayer::PlayVideo    = "MediaPlayer.Play.Video";
const QString MediaPlayer::PlayAudio    = "MediaPlayer.Play.Audio";
const QString MediaPlayer::Close        = "MediaPlayer.Close";

QStringList MediaPlayer::allCapabilities()
{
	return {DisplayImage, PlayVideo, PlayAudio, Close};
}





const QString MediaControl::Play        = "MediaControl.Play";
const QString MediaControl::Pause       = "MediaControl.Pause";
const QString MediaControl::Stop        = "MediaControl.Stop";
const QString MediaControl::Rewind      = "MediaControl.Rewind";
const QString MediaControl::FastForward = "MediaControl.FastForward";
const QString MediaControl::Seek        = "MediaControl.Seek";
const QString MediaControl::Position    = "MediaControl.Position";

QStringList MediaControl::allCapabilities()
{
	return {Play, Pause, Stop, Rewind, FastForward, Seek, Position};
}





const QString VolumeControl::Get     = "VolumeControl.Get";
const QString VolumeControl::Set     = "VolumeControl.Set";
const QString VolumeControl::UpDown  = "VolumeControl.UpDown";
const QString VolumeControl::MuteGet = "VolumeControl.Mute.Get";
const QString VolumeControl::MuteSet = "VolumeControl.Mute.Set";

QStringList VolumeControl::allCapabilities()
{
	return {Get, Set, UpDown, MuteGet, MuteSet};
}





const QString TVControl::ChannelUp   = "TVControl.Channel.Up";
const QString TVControl::ChannelDown = "TVControl.Channel.Down";
const QString TVControl::ChannelSet  = "TVControl.Channel.Set";
const QString TVControl::ChannelGet  = "TVControl.Channel.Get";
const QString TVControl::ChannelList = "TVControl.Channel.List";

QStringList TVControl::allCapabilities()
{
	return {ChannelUp, ChannelDown, ChannelSet, ChannelGet, ChannelList};
}





const QString KeyControl::Up      = "KeyControl.Up";
const QString KeyControl::Down    = "KeyControl.Down";
const QString KeyControl::Left    = "KeyControl.Left";
const QString KeyControl::Right   = "KeyControl.Right";
const QString KeyControl::OK      = "KeyControl.OK";
const QString KeyControl::Back    = "KeyControl.Back";
const QString KeyControl::Home    = "KeyControl.Home";
const QString KeyControl::KeyCode = "KeyControl.Send.KeyCode";

QStringList KeyControl::allCapabilities()
{
	return {Up, Down, Left, Right, OK, Back, Home, KeyCode};
}





const QString TextInputControl::Send   = "TextInputControl.Send";
const QString TextInputControl::Enter  = "TextInputControl.Enter";
const QString TextInputControl::Delete = "TextInputControl.Delete";

QStringList TextInputControl::allCapabilities()
{
	return {Send, Enter, Delete};
}





const QString MouseControl::Connect    = "MouseControl.Connect";
const QString MouseControl::Disconnect = "MouseControl.Disconnect";
const QString MouseControl::Click      = "MouseControl.Click";
const QString MouseControl::Move       = "MouseControl.Move";
const QString MouseControl::Scroll     = "MouseControl.Scroll";

QStringList MouseControl::allCapabilities()
{
	return {Connect, Disconnect, Click, Move, Scroll};
}





const QString PowerControl::Off = "PowerControl.Off";
const QString PowerControl::On  = "PowerControl.On";

QStringList PowerControl::allCapabilities()
{
	return {Off, On};
}





const QString ToastControl::Show             = "ToastControl.Show";
const QString ToastControl::ShowClickableApp = "ToastControl.Show.Clickable.App";
const QString ToastControl::ShowClickableUrl = "ToastControl.Show.Clickable.URL";

QStringList ToastControl::allCapabilities()
{
	return {Show, ShowClickableApp, ShowClickableUrl};
}





const QString WebAppLauncher::Launch       = "WebAppLauncher.Launch";
const QString WebAppLauncher::LaunchParams = "WebAppLauncher.Launch.Params";
const QString WebAppLauncher::MessageSend  = "WebAppLauncher.Message.Send";
const QString WebAppLauncher::Close        = "WebAppLauncher.Close";
const QString WebAppLauncher::Join         = "WebAppLauncher.Join";

QStringList WebAppLauncher::allCapabilities()
{
	return {Launch, LaunchParams, MessageSend, Close, Join};
}





const QString ExternalInputControl::PickerLaunch = "ExternalInputControl.Picker.Launch";
const QString ExternalInputControl::PickerClose  = "ExternalInputControl.Picker.Close";
const QString ExternalInputControl::List         = "ExternalInputControl.List";
const QString ExternalInputControl::Set          = "ExternalInputControl.Set";

QStringList ExternalInputControl::allCapabilities()
{
	return {PickerLaunch, PickerClose, List, Set};
}
